#include "core/instance_message.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

void to_json(nlohmann::json &j, const InstanceMessage &message)
{
    j = nlohmann::json{
        {"cmd", message.cmd},
        {"args", message.args},
        {"cwd", message.cwd},
        {"group_id", message.group_id},
        {"pid", message.pid}};
}

void from_json(const nlohmann::json &j, InstanceMessage &message)
{
    message.cmd = j.at("cmd").get<std::string>();
    message.args = j.value("args", std::vector<std::string>{});
    message.cwd = j.value("cwd", std::string());
    message.group_id = j.value("group_id", std::string());
    message.pid = j.value("pid", 0);
}

std::string InstanceMessageCodec::encode(const InstanceMessage &message)
{
    std::string payload = nlohmann::json(message).dump();
    payload.push_back('\0');
    return payload;
}

std::optional<InstanceMessage> InstanceMessageCodec::decode(const std::string &payload)
{
    std::string body = payload;
    auto terminator = body.find('\0');
    if (terminator != std::string::npos)
    {
        body.resize(terminator);
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        return std::nullopt;
    }

    try
    {
        return parsed.get<InstanceMessage>();
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("Ignoring instance message with invalid fields: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool InstanceMessageCodec::writeMessage(int fd, const InstanceMessage &message)
{
    std::string payload = encode(message);
    size_t written = 0;
    while (written < payload.size())
    {
        ssize_t n = ::send(fd, payload.data() + written, payload.size() - written, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            Logger::error("Failed to send instance message: " + std::string(std::strerror(errno)));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

std::optional<InstanceMessage> InstanceMessageCodec::readMessage(int fd, std::chrono::milliseconds timeout)
{
    std::string payload;
    char buffer[4096];

    for (;;)
    {
        struct pollfd pfd = {fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            Logger::error("poll() failed while reading instance message: " + std::string(std::strerror(errno)));
            return std::nullopt;
        }
        if (ready == 0)
        {
            Logger::warn("Timed out reading instance message");
            return std::nullopt;
        }

        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            Logger::error("Failed to read instance message: " + std::string(std::strerror(errno)));
            return std::nullopt;
        }
        if (n == 0)
        {
            break;
        }

        payload.append(buffer, static_cast<size_t>(n));
        if (payload.find('\0') != std::string::npos)
        {
            break;
        }
        if (payload.size() > MAX_MESSAGE_SIZE)
        {
            Logger::warn("Instance message exceeds " + std::to_string(MAX_MESSAGE_SIZE) + " bytes, dropping it");
            return std::nullopt;
        }
    }

    if (payload.empty())
    {
        return std::nullopt;
    }

    auto message = decode(payload);
    if (!message)
    {
        Logger::warn("Dropping malformed instance message");
    }
    return message;
}
