#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Request a client instance forwards to the running server instance
 *
 * On the wire a message is one JSON object terminated by a NUL byte.
 */
struct InstanceMessage
{
    std::string cmd = "new_instance";
    std::vector<std::string> args;
    std::string cwd;
    std::string group_id;
    int pid = 0;
};

void to_json(nlohmann::json &j, const InstanceMessage &message);
void from_json(const nlohmann::json &j, InstanceMessage &message);

class InstanceMessageCodec
{
public:
    // Encoded payload including the trailing NUL terminator
    static std::string encode(const InstanceMessage &message);

    // Decode a payload with or without its terminator, nullopt when malformed
    static std::optional<InstanceMessage> decode(const std::string &payload);

    // Write the whole encoded message, retrying on EINTR and short writes
    static bool writeMessage(int fd, const InstanceMessage &message);

    // Read up to the terminator or EOF, giving up when no data arrives within timeout
    static std::optional<InstanceMessage> readMessage(int fd, std::chrono::milliseconds timeout);

    static constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;
};
