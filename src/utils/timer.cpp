#include <sstream>
#include <string>
#include "utils/timer.hpp"

std::size_t Timer::start()
{
    epochs.emplace_back( std::chrono::steady_clock::now());
    return epochs.size() - 1;
}

std::chrono::milliseconds Timer::elapsed( std::size_t id)
{
    if( id >= epochs.size())
        return std::chrono::milliseconds::zero();

    return std::chrono::duration_cast<std::chrono::milliseconds>( std::chrono::steady_clock::now() - epochs[ id]);
}

std::string Timer::yield( std::size_t id)
{
    return format( elapsed( id));
}

std::string Timer::format( std::chrono::milliseconds duration)
{
    auto time_value     = duration.count();
    size_t minutes      = time_value / ( 1000 * 60),
           seconds      = ( time_value - minutes * 1000 * 60) / 1000,
           milliseconds = ( time_value - seconds * 1000 - minutes * 1000 * 60);
    std::stringstream out;
    auto unit = [ &out]( size_t value, const char *name)
    {
        if( out.tellp() > 0)
            out << ", ";
        out << value << ' ' << name;
        if( value != 1)
            out << 's';
    };

    if( minutes != 0)
        unit( minutes, "minute");
    if( seconds != 0)
        unit( seconds, "second");
    if( milliseconds != 0 || out.tellp() == 0)
        unit( milliseconds, "millisecond");

    return out.str();
}

std::vector<std::chrono::time_point<std::chrono::steady_clock>> Timer::epochs;
