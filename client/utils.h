#pragma once

#include "TestResults.hpp"
#include <string>

void append_result_to_file(const TestResult& r, const std::string& path);
