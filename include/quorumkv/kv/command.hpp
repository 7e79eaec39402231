#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace quorumkv::kv {

    enum class CommandType : uint8_t {
        SET = 1,
        DELETE = 2
    };

    inline std::string command_type_to_string(CommandType type) {
        switch (type) {
        case CommandType::SET: return "SET";
        case CommandType::DELETE: return "DELETE";
        default: return "UNKNOWN";
        }
    }

    inline bool is_command_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }

    inline std::vector<std::string> split_tokens(const std::string& text) {
        std::vector<std::string> tokens;
        size_t i = 0;
        while (i < text.size()) {
            while (i < text.size() && is_command_space(text[i])) ++i;
            size_t start = i;
            while (i < text.size() && !is_command_space(text[i])) ++i;
            if (i > start) {
                tokens.emplace_back(text, start, i - start);
            }
        }
        return tokens;
    }

    // Mutation carried in a normal log entry. Wire form is whitespace-delimited text:
    //   "SET <key> <value>"
    //   "DELETE <key>"
    struct Command {
        CommandType type;
        std::string key;
        std::string value;

        Command() : type(CommandType::SET) {}

        Command(CommandType t, const std::string& k, const std::string& v = "")
            : type(t), key(k), value(v) {
        }

        std::string serialize() const {
            if (type == CommandType::SET) {
                return "SET " + key + " " + value;
            }
            return "DELETE " + key;
        }

        // Total: never throws, returns false for anything that is not one of the two shapes.
        static bool deserialize(const std::string& data, Command& cmd) {
            std::vector<std::string> tokens = split_tokens(data);

            if (tokens.size() == 3 && tokens[0] == "SET") {
                cmd = Command(CommandType::SET, tokens[1], tokens[2]);
                return true;
            }
            if (tokens.size() == 2 && tokens[0] == "DELETE") {
                cmd = Command(CommandType::DELETE, tokens[1]);
                return true;
            }
            return false;
        }

        // True when serialize() followed by deserialize() gives this command back
        bool is_valid() const {
            auto has_space = [](const std::string& s) {
                for (char c : s) {
                    if (is_command_space(c)) return true;
                }
                return false;
            };

            if (key.empty() || has_space(key)) {
                return false;
            }
            if (type == CommandType::SET) {
                return !value.empty() && !has_space(value);
            }
            return true;
        }

        std::string to_string() const {
            if (type == CommandType::SET) {
                return "SET '" + key + "' = '" + value + "'";
            }
            return "DELETE '" + key + "'";
        }
    };

}
