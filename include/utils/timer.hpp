#ifndef CSSCOLORS_TIMER_HPP
#define CSSCOLORS_TIMER_HPP

#include <chrono>
#include <string>
#include <vector>

class Timer
{
public:
    // Records a new epoch and returns its ID.
    static std::size_t start();

    static std::chrono::milliseconds elapsed( std::size_t id);

    // Time since epoch `id` in words, e.g. "1 second, 20 milliseconds".
    static std::string yield( std::size_t id);

    static std::string format( std::chrono::milliseconds duration);
private:
    static std::vector<std::chrono::time_point<std::chrono::steady_clock>> epochs;
};

#endif //CSSCOLORS_TIMER_HPP
