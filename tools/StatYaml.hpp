/**
 * @file StatYaml.hpp
 * @brief YAML form of Stat records, used by the ninep-stat tool.
 *
 * Document shape:
 *
 *   stats:
 *     - type: 0
 *       dev: 0
 *       qid: "80000000000000000000000001"   # 26 hex digits
 *       mode: 2147484141
 *       atime: 0
 *       mtime: 0
 *       length: 0
 *       name: "tmp"
 *       uid: "glenda"
 *       gid: "glenda"
 *       muid: "glenda"
 *
 * Missing numeric keys default to 0 and missing strings to "".
 */

#pragma once

#include "ninep/Qid.hpp"
#include "ninep/Stat.hpp"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace ninep::yaml
{
    /**
     * @brief Parses a Qid from 26 hex digits (either case).
     * @throws std::runtime_error on a wrong length or a non-hex digit.
     */
    Qid parseQid(const std::string& hex);

    /// Formats a Qid as 26 lowercase hex digits.
    std::string formatQid(const Qid& qid);

    /**
     * @brief Converts the `stats` sequence of a document into records.
     * @throws std::runtime_error naming the failing record index.
     */
    std::vector<Stat> parseStats(const YAML::Node& root);

    /// Loads and parses a YAML file.
    std::vector<Stat> loadStats(const std::string& path);

    /// Builds a document that parseStats() reads back unchanged.
    YAML::Node toYaml(const std::vector<Stat>& stats);

} // namespace ninep::yaml
