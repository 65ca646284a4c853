#include "net/redis_connection.hpp"

#include <hiredis/hiredis.h>
#include <spdlog/spdlog.h>
#include <sys/time.h>
#include <chrono>
#include <utility>

namespace TierCache::Net
{

using Storage::make_error_code;
using Storage::StorageErrc;

namespace
{

struct ReplyDeleter {
    void operator()(redisReply* reply) const { freeReplyObject(reply); }
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

timeval ToTimeval(std::chrono::milliseconds timeout)
{
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

std::error_code ToErrorCode(int hiredis_err)
{
    switch (hiredis_err) {
        case REDIS_ERR_TIMEOUT:
            return make_error_code(StorageErrc::Timeout);
        case REDIS_ERR_PROTOCOL:
            return make_error_code(StorageErrc::ProtocolError);
        case REDIS_ERR_OOM:
            return make_error_code(StorageErrc::OutOfSpace);
        default:
            return make_error_code(StorageErrc::ConnectionFailed);
    }
}

RespValue Convert(const redisReply& reply)
{
    RespValue value;
    switch (reply.type) {
        case REDIS_REPLY_STATUS:
            value.type = RespValue::Type::SimpleString;
            value.text.assign(reply.str, reply.len);
            break;
        case REDIS_REPLY_ERROR:
            value.type = RespValue::Type::Error;
            value.text.assign(reply.str, reply.len);
            break;
        case REDIS_REPLY_INTEGER:
            value.type    = RespValue::Type::Integer;
            value.integer = reply.integer;
            break;
        case REDIS_REPLY_STRING:
            value.type = RespValue::Type::BulkString;
            value.text.assign(reply.str, reply.len);
            break;
        case REDIS_REPLY_ARRAY:
            value.type = RespValue::Type::Array;
            value.elements.reserve(reply.elements);
            for (std::size_t i = 0; i < reply.elements; ++i) {
                value.elements.push_back(Convert(*reply.element[i]));
            }
            break;
        default:
            value.type = RespValue::Type::Null;
            break;
    }
    return value;
}

}  // namespace

RedisConnection::RedisConnection(ContextPtr context) : context_(std::move(context)) {}

StorageResult<std::unique_ptr<RedisConnection>> RedisConnection::Open(
    const Config::NetworkSettings& settings
)
{
    const auto timeout = ToTimeval(
        std::chrono::duration_cast<std::chrono::milliseconds>(settings.connect_timeout)
    );
    ContextPtr context(
        redisConnectWithTimeout(settings.host.c_str(), settings.port, timeout), &redisFree
    );
    if (!context) {
        spdlog::debug("Cannot allocate connection context for {}:{}", settings.host, settings.port);
        return std::unexpected(make_error_code(StorageErrc::OutOfSpace));
    }
    if (context->err != 0) {
        spdlog::debug(
            "Connecting to {}:{} failed: {}", settings.host, settings.port, context->errstr
        );
        return std::unexpected(ToErrorCode(context->err));
    }
    // Replies use the same bound as the connect
    if (redisSetTimeout(context.get(), timeout) != REDIS_OK) {
        return std::unexpected(ToErrorCode(context->err));
    }

    auto conn = std::make_unique<RedisConnection>(std::move(context));

    if (!settings.password.empty()) {
        auto reply = conn->Command({"AUTH", settings.password});
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (!reply->IsOk()) {
            spdlog::warn("Authentication to {}:{} rejected", settings.host, settings.port);
            return std::unexpected(make_error_code(StorageErrc::PermissionDenied));
        }
    }
    if (settings.database != 0) {
        auto reply = conn->Command({"SELECT", std::to_string(settings.database)});
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (!reply->IsOk()) {
            spdlog::warn(
                "Selecting database {} on {}:{} failed: {}", settings.database, settings.host,
                settings.port, reply->text
            );
            return std::unexpected(make_error_code(StorageErrc::InvalidConfiguration));
        }
    }
    return conn;
}

bool RedisConnection::IsOpen() const { return context_ && context_->err == 0; }

std::error_code RedisConnection::ContextError()
{
    const auto ec = context_ ? ToErrorCode(context_->err)
                             : make_error_code(StorageErrc::ConnectionFailed);
    if (context_) {
        spdlog::debug("Connection error: {}", context_->errstr);
    }
    Close();
    return ec;
}

StorageResult<void> RedisConnection::Append(const std::vector<std::string>& args)
{
    if (!IsOpen()) {
        return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
    }
    std::vector<const char*> argv;
    std::vector<std::size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }
    if (redisAppendCommandArgv(
            context_.get(), static_cast<int>(args.size()), argv.data(), argvlen.data()
        ) != REDIS_OK) {
        return std::unexpected(ContextError());
    }
    return {};
}

StorageResult<RespValue> RedisConnection::ReadReply()
{
    void* raw = nullptr;
    if (redisGetReply(context_.get(), &raw) != REDIS_OK || raw == nullptr) {
        return std::unexpected(ContextError());
    }
    ReplyPtr reply(static_cast<redisReply*>(raw));
    return Convert(*reply);
}

StorageResult<RespValue> RedisConnection::Command(const std::vector<std::string>& args)
{
    if (auto appended = Append(args); !appended) {
        return std::unexpected(appended.error());
    }
    return ReadReply();
}

StorageResult<std::vector<RespValue>> RedisConnection::Pipeline(
    const std::vector<std::vector<std::string>>& commands
)
{
    for (const auto& args : commands) {
        if (auto appended = Append(args); !appended) {
            return std::unexpected(appended.error());
        }
    }

    std::vector<RespValue> replies;
    replies.reserve(commands.size());
    for (std::size_t i = 0; i < commands.size(); ++i) {
        auto reply = ReadReply();
        if (!reply) {
            return std::unexpected(reply.error());
        }
        replies.push_back(std::move(*reply));
    }
    return replies;
}

StorageResult<void> RedisConnection::Ping()
{
    auto reply = Command({"PING"});
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (reply->type != RespValue::Type::SimpleString || reply->text != "PONG") {
        return std::unexpected(make_error_code(StorageErrc::ProtocolError));
    }
    return {};
}

}  // namespace TierCache::Net
