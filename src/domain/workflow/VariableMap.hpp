/**
 * @file VariableMap.hpp
 * @brief Case-insensitive string map used for workflow instance variables.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace waypoint::domain::workflow {

/**
 * @struct CaseInsensitiveLess
 * @brief Orders ASCII strings ignoring letter case ("Status" == "status").
 */
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) <
                       std::tolower(static_cast<unsigned char>(y));
            });
    }
};

/// Variable bag of a workflow instance. Keys compare case-insensitively.
using VariableMap = std::map<std::string, std::string, CaseInsensitiveLess>;

/// Plain parameter map attached to action nodes (case-insensitive as well).
using ParameterMap = std::map<std::string, std::string, CaseInsensitiveLess>;

} // namespace waypoint::domain::workflow
