#pragma once

#include <boost/leaf/on_error.hpp>

#define SEMTOOL_CONCAT_1(A, B) A##B
#define SEMTOOL_CONCAT(A, B) SEMTOOL_CONCAT_1(A, B)

/**
 * @brief Generate a callable object that returns the given expression.
 *
 * Use this as a parameter to leaf's error-loading APIs.
 */
#define SEMTOOL_E_ARG(...) ([&] { return __VA_ARGS__; })

/**
 * @brief Generate a leaf::on_error object that loads the given expression into the currently
 * in-flight error if the current scope is exited via exception or a bad result<>
 */
#define SEMTOOL_E_SCOPE(...)                                                                       \
    auto SEMTOOL_CONCAT(_err_info_, __LINE__) = boost::leaf::on_error(SEMTOOL_E_ARG(__VA_ARGS__))
