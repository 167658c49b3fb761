#include "app/spdlog_tmp.hpp"

std::shared_ptr<spdlog::logger> logger_;

void initLogger(std::string const& level)
{
    logger_ = spdlog::get("console");
    if (!logger_)
        logger_ = spdlog::stdout_color_mt("console");
    logger_->set_level(spdlog::level::from_str(level));
}
