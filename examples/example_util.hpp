#pragma once

#include <iostream>
#include <smtpchan/detail/result.hpp>

inline void print_error(const smtpchan::error_info& err)
{
    std::cout << "Error: " << smtpchan::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        std::cout << "Detail: " << err.detail << "\n";
    if (err.sys)
        std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}
