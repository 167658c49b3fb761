#pragma once

#include "include/pch.hpp"

extern std::shared_ptr<spdlog::logger> logger_;

void initLogger(std::string const& level = "info");
