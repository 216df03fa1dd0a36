#ifndef REDEX_LOG_HPP
#define REDEX_LOG_HPP

#include <ostream>
#include <sstream>

namespace redex
{

enum class log_level
{
    debug,
    info,
    warn,
    error,
    off,
};

// prints the level tag, e.g. "[WARN ]"
std::ostream& operator<<(std::ostream& a_ostream, log_level a_level);

// the sink defaults to std::clog at level warn. both settings are meant to be
// configured once at startup, before any reduction runs.
void set_log_level(log_level a_level);
log_level get_log_level();
void set_log_stream(std::ostream& a_ostream);
bool log_enabled(log_level a_level);

// accumulates one message and writes it to the sink as a single line when
// destroyed. disabled levels cost one comparison per insertion.
class log_line
{
  public:
    explicit log_line(log_level a_level);
    ~log_line();

    log_line(const log_line&) = delete;
    log_line& operator=(const log_line&) = delete;

    template <typename T> log_line& operator<<(const T& a_value)
    {
        if(m_enabled)
            m_buffer << a_value;
        return *this;
    }

  private:
    log_level m_level;
    bool m_enabled;
    std::ostringstream m_buffer;
};

} // namespace redex

#define REDEX_LOG(a_level) ::redex::log_line(::redex::log_level::a_level)

#endif
