#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace pgentry::config
{

// YAML config parser using yaml-cpp library
class ServiceConfig
    {
    public:
        ServiceConfig() = default;

        static ServiceConfig& instance()
            {
            static ServiceConfig config;
            return config;
            }

        // Load config from file. On failure the previous contents are
        // discarded and last_error() describes the problem.
        bool load(const std::string& config_file)
            {
            try
                {
                root_.reset(YAML::LoadFile(config_file));
                loaded_ = true;
                last_error_.clear();
                return true;
                }
                catch (const YAML::BadFile&)
                    {
                    last_error_ = "cannot open " + config_file;
                    }
                catch (const YAML::Exception& e)
                    {
                    last_error_ = config_file + ": " + e.what();
                    }

                root_.reset();
                loaded_ = false;
                return false;
            }

        bool loaded() const { return loaded_; }

        const std::string& last_error() const { return last_error_; }

        // Get string value with default
        std::string get_string(const std::string& key, const std::string& default_val = "") const
            {
            YAML::Node node = scalar_at(key);
            if (!node) return default_val;
            return node.as<std::string>();
            }

        // Get int value with default. A value that is not an integer throws
        // YAML::BadConversion so that typos are not silently ignored.
        int get_int(const std::string& key, int default_val = 0) const
            {
            YAML::Node node = scalar_at(key);
            if (!node) return default_val;
            return node.as<int>();
            }

        // Get bool value with default
        bool get_bool(const std::string& key, bool default_val = false) const
            {
            YAML::Node node = scalar_at(key);
            if (!node) return default_val;
            return node.as<bool>();
            }

        // Get a sequence of strings. A single scalar is treated as a one
        // element list.
        std::vector<std::string> get_string_list(const std::string& key,
                                                 const std::vector<std::string>& default_val = {}) const
            {
            if (!loaded_) return default_val;

            YAML::Node node = navigate_to_key(key);
            if (!node || node.IsNull()) return default_val;

            std::vector<std::string> values;
            if (node.IsScalar())
                {
                values.push_back(node.as<std::string>());
                }
            else if (node.IsSequence())
                {
                for (const auto& item : node)
                    {
                    values.push_back(item.as<std::string>());
                    }
                }
            else
                {
                throw YAML::BadConversion(node.Mark());
                }
            return values;
            }

        bool has(const std::string& key) const
            {
            if (!loaded_) return false;
            YAML::Node node = navigate_to_key(key);
            return node && !node.IsNull();
            }

    private:
        YAML::Node scalar_at(const std::string& key) const
            {
            if (!loaded_) return YAML::Node(YAML::NodeType::Undefined);

            YAML::Node node = navigate_to_key(key);
            if (node && node.IsScalar())
                {
                return node;
                }
            return YAML::Node(YAML::NodeType::Undefined);
            }

        // Navigate to a key using dot notation (e.g., "section.subsection.key").
        // Works on const nodes only; assigning between YAML::Node handles
        // would rewrite the loaded tree.
        YAML::Node navigate_to_key(const std::string& key) const
            {
            return descend(root_, key, 0);
            }

        static YAML::Node descend(const YAML::Node& node, const std::string& key, size_t start)
            {
            if (!node || !node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);

            size_t end = key.find('.', start);
            std::string part = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
            const YAML::Node child = node[part];

            if (end == std::string::npos) return child;
            return descend(child, key, end + 1);
            }

        YAML::Node root_;
        bool loaded_ = false;
        std::string last_error_;
    };

} // namespace pgentry::config
