#include <cborkit/utils.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace cborkit
{

std::shared_ptr<spdlog::logger> logger()
{
    class Singleton
    {
    public:
        static Singleton& get_instance()
        {
            static Singleton instance;
            return instance;
        }

        Singleton(const Singleton& root) = delete;
        Singleton& operator=(const Singleton&) = delete;
        Singleton(Singleton&& root) = delete;
        Singleton& operator=(Singleton&&) = delete;

        std::shared_ptr<spdlog::logger> logger;

    private:
        Singleton()
        {
            logger = spdlog::stdout_logger_mt("cborkit");
#ifndef NDEBUG
            logger->set_level(spdlog::level::debug);
#else
            logger->set_level(spdlog::level::info);
#endif
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [tid %t] [%n] [%l] %v");
        }
    };

    return Singleton::get_instance().logger;
}

}  // namespace cborkit
