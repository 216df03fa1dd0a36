#include "../include/redex/log.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>

namespace redex
{

namespace
{

std::atomic<log_level> g_log_level{log_level::warn};
std::atomic<std::ostream*> g_log_stream{&std::clog};
std::mutex g_log_write_mutex;

} // namespace

std::ostream& operator<<(std::ostream& a_ostream, log_level a_level)
{
    switch(a_level)
    {
    case log_level::debug:
        return a_ostream << "[DEBUG]";
    case log_level::info:
        return a_ostream << "[INFO ]";
    case log_level::warn:
        return a_ostream << "[WARN ]";
    case log_level::error:
        return a_ostream << "[ERROR]";
    case log_level::off:
        return a_ostream << "[OFF  ]";
    }
    return a_ostream;
}

void set_log_level(log_level a_level)
{
    g_log_level.store(a_level);
}

log_level get_log_level()
{
    return g_log_level.load();
}

void set_log_stream(std::ostream& a_ostream)
{
    g_log_stream.store(&a_ostream);
}

bool log_enabled(log_level a_level)
{
    // "off" is a threshold only, nothing is ever logged at it
    return a_level != log_level::off && a_level >= g_log_level.load();
}

log_line::log_line(log_level a_level)
    : m_level(a_level), m_enabled(log_enabled(a_level)), m_buffer()
{
}

log_line::~log_line()
{
    if(!m_enabled)
        return;

    try
    {
        std::lock_guard<std::mutex> l_lock(g_log_write_mutex);
        std::ostream& l_stream = *g_log_stream.load();
        l_stream << m_level << " " << m_buffer.str() << '\n';
        l_stream.flush();
    }
    catch(const std::exception&)
    {
        // a failing sink loses the line, it never takes the caller down
    }
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"
#include <sstream>
#include <streambuf>
#include <string>

using namespace redex;

void test_log_level_filter()
{
    std::ostringstream l_sink;
    set_log_stream(l_sink);

    // warn threshold drops debug and info
    {
        set_log_level(log_level::warn);
        REDEX_LOG(debug) << "hidden " << 1;
        REDEX_LOG(info) << "hidden " << 2;
        assert(l_sink.str().empty());
    }

    // warn and error pass through, one line each
    {
        REDEX_LOG(warn) << "stagnation at step " << 2;
        REDEX_LOG(error) << "bad";
        assert(l_sink.str() == "[WARN ] stagnation at step 2\n"
                               "[ERROR] bad\n");
    }

    // off silences everything
    {
        l_sink.str("");
        set_log_level(log_level::off);
        REDEX_LOG(error) << "hidden";
        assert(l_sink.str().empty());
        assert(!log_enabled(log_level::error));
    }

    // debug threshold lets everything through
    {
        set_log_level(log_level::debug);
        assert(log_enabled(log_level::debug));
        assert(!log_enabled(log_level::off));
        REDEX_LOG(debug) << "step";
        assert(l_sink.str() == "[DEBUG] step\n");
    }

    // restore defaults for the other tests
    set_log_level(log_level::warn);
    set_log_stream(std::clog);
    assert(get_log_level() == log_level::warn);
}

namespace
{

// refuses every character
struct rejecting_buffer : std::streambuf
{
    int_type overflow(int_type) override
    {
        return traits_type::eof();
    }
};

} // namespace

void test_log_throwing_sink()
{
    rejecting_buffer l_buffer;
    std::ostream l_sink(&l_buffer);
    l_sink.exceptions(std::ios::badbit | std::ios::failbit);
    set_log_stream(l_sink);
    set_log_level(log_level::warn);

    // the write throws std::ios_base::failure, the line is dropped
    REDEX_LOG(error) << "lost";
    assert(l_sink.bad());

    // later lines on the broken sink are dropped the same way
    REDEX_LOG(warn) << "lost too";

    // a healthy sink works again afterwards
    std::ostringstream l_healthy;
    set_log_stream(l_healthy);
    REDEX_LOG(warn) << "kept";
    assert(l_healthy.str() == "[WARN ] kept\n");

    set_log_stream(std::clog);
}

void log_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_log_level_filter);
    TEST(test_log_throwing_sink);
}

#endif
