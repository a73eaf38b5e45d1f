/**
 * @file StatYaml.cpp
 * @brief Implementation of the YAML <-> Stat conversion.
 */

#include "StatYaml.hpp"
#include <stdexcept>

namespace ninep::yaml
{
    namespace
    {
        int hexValue(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        template <typename T>
        T numberOr(const YAML::Node& node, const char* key)
        {
            return node[key] ? node[key].as<T>() : T{};
        }

        std::string stringOr(const YAML::Node& node, const char* key)
        {
            return node[key] ? node[key].as<std::string>() : std::string{};
        }

        Stat parseStat(const YAML::Node& node)
        {
            if (!node.IsMap())
            {
                throw std::runtime_error("expected a map");
            }

            Stat stat;
            stat.type   = numberOr<uint16_t>(node, "type");
            stat.dev    = numberOr<uint32_t>(node, "dev");
            if (node["qid"])
            {
                stat.qid = parseQid(node["qid"].as<std::string>());
            }
            stat.mode   = numberOr<uint32_t>(node, "mode");
            stat.atime  = numberOr<uint32_t>(node, "atime");
            stat.mtime  = numberOr<uint32_t>(node, "mtime");
            stat.length = numberOr<uint64_t>(node, "length");
            stat.name   = stringOr(node, "name");
            stat.uid    = stringOr(node, "uid");
            stat.gid    = stringOr(node, "gid");
            stat.muid   = stringOr(node, "muid");
            return stat;
        }
    }

    Qid parseQid(const std::string& hex)
    {
        if (hex.size() != Qid::kSize * 2)
        {
            throw std::runtime_error(
                "Invalid qid '" + hex + "': expected " +
                std::to_string(Qid::kSize * 2) + " hex digits"
            );
        }

        Qid::Bytes bytes;
        for (size_t i = 0; i < Qid::kSize; ++i)
        {
            int hi = hexValue(hex[2 * i]);
            int lo = hexValue(hex[2 * i + 1]);
            if (hi < 0 || lo < 0)
            {
                throw std::runtime_error("Invalid qid '" + hex + "': not a hex string");
            }
            bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return Qid(bytes);
    }

    std::string formatQid(const Qid& qid)
    {
        static const char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(Qid::kSize * 2);
        for (uint8_t b : qid.bytes())
        {
            hex.push_back(digits[b >> 4]);
            hex.push_back(digits[b & 0x0f]);
        }
        return hex;
    }

    std::vector<Stat> parseStats(const YAML::Node& root)
    {
        const YAML::Node list = root["stats"];
        if (!list)
        {
            throw std::runtime_error("Missing required 'stats' sequence");
        }
        if (!list.IsSequence())
        {
            throw std::runtime_error("'stats' must be a sequence");
        }

        std::vector<Stat> stats;
        stats.reserve(list.size());
        for (size_t i = 0; i < list.size(); ++i)
        {
            try
            {
                stats.push_back(parseStat(list[i]));
            }
            catch (const std::exception& e)
            {
                throw std::runtime_error(
                    "stats[" + std::to_string(i) + "]: " + e.what()
                );
            }
        }
        return stats;
    }

    std::vector<Stat> loadStats(const std::string& path)
    {
        YAML::Node root;
        try
        {
            root = YAML::LoadFile(path);
        }
        catch (const YAML::Exception& e)
        {
            throw std::runtime_error("Failed to parse YAML '" + path + "': " + e.what());
        }
        return parseStats(root);
    }

    YAML::Node toYaml(const std::vector<Stat>& stats)
    {
        YAML::Node root;
        YAML::Node list(YAML::NodeType::Sequence);
        for (const auto& stat : stats)
        {
            YAML::Node node;
            node["type"]   = stat.type;
            node["dev"]    = stat.dev;
            node["qid"]    = formatQid(stat.qid);
            node["mode"]   = stat.mode;
            node["atime"]  = stat.atime;
            node["mtime"]  = stat.mtime;
            node["length"] = stat.length;
            node["name"]   = stat.name;
            node["uid"]    = stat.uid;
            node["gid"]    = stat.gid;
            node["muid"]   = stat.muid;
            list.push_back(node);
        }
        root["stats"] = list;
        return root;
    }

} // namespace ninep::yaml
