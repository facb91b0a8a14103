// SPDX-License-Identifier: Apache-2.0
#include "ServiceApi.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Time.hpp>
#include <rpc/JsonRpc.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>

#include <poll.h>
#include <unistd.h>

namespace sightline
{

namespace
{

    auto queryError(std::string message) -> Error
    {
        return Error { .code = ErrorCode::QueryError, .message = std::move(message) };
    }

    /// @brief Reads an integer given as a JSON number or a decimal string.
    auto integerParam(const nlohmann::json& params, const char* key, std::int64_t defaultValue)
        -> Result<std::int64_t>
    {
        if (!params.contains(key) || params[key].is_null())
            return defaultValue;

        auto const& value = params[key];
        if (value.is_number_integer())
            return value.get<std::int64_t>();

        if (value.is_string())
        {
            auto const text = value.get<std::string>();
            auto parsed = std::int64_t { 0 };
            auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (ec == std::errc {} && end == text.data() + text.size())
                return parsed;
        }
        return std::unexpected(queryError(std::format("'{}' must be an integer", key)));
    }

    auto optionalString(const nlohmann::json& params, const char* key) -> std::optional<std::string>
    {
        if (params.contains(key) && params[key].is_string())
            return params[key].get<std::string>();
        return std::nullopt;
    }

    auto timestampParam(const nlohmann::json& params, const char* key) -> Result<std::optional<Timestamp>>
    {
        auto text = optionalString(params, key);
        if (!text)
            return std::optional<Timestamp> {};
        auto parsed = parseTimestamp(*text);
        if (!parsed)
            return std::unexpected(queryError(std::format("Invalid '{}': {}", key, parsed.error().message)));
        return std::optional<Timestamp> { *parsed };
    }

    auto timestampJson(const std::optional<Timestamp>& ts) -> nlohmann::json
    {
        if (!ts)
            return nullptr;
        return formatTimestamp(*ts);
    }

    auto optionalJson(const std::optional<std::string>& value) -> nlohmann::json
    {
        if (!value)
            return nullptr;
        return *value;
    }

    auto rpcErrorCode(ErrorCode code) -> int
    {
        switch (code)
        {
            case ErrorCode::InvalidArgument:
            case ErrorCode::QueryError: return jsonrpc::codes::InvalidParams;
            default: return jsonrpc::codes::InternalError;
        }
    }

    auto errorResponse(const nlohmann::json& id, const Error& error) -> nlohmann::json
    {
        auto response = jsonrpc::makeErrorResponse(id, rpcErrorCode(error.code), error.message);
        response["error"]["data"] = { { "kind", errorCodeName(error.code) } };
        return response;
    }

    constexpr auto Methods = std::array<std::string_view, 9> {
        "search",      "listAudioDevices", "listMonitors", "addTags",        "removeTags",
        "health",      "pauseVision",      "resumeVision", "setDeviceState",
    };

    auto writeAll(int fd, std::string_view data) -> VoidResult
    {
        while (!data.empty())
        {
            auto const written = ::write(fd, data.data(), data.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return makeError(ErrorCode::IoError, std::format("write failed: {}", strerror(errno)));
            }
            data.remove_prefix(static_cast<size_t>(written));
        }
        return {};
    }

} // namespace

auto parseSearchQuery(const nlohmann::json& params) -> Result<SearchQuery>
{
    if (!params.is_null() && !params.is_object())
        return std::unexpected(queryError("Search parameters must be an object"));

    auto const p = params.is_null() ? nlohmann::json::object() : params;
    auto query = SearchQuery {};
    query.text = json::getStringOr(p, "q", "");

    auto const type = json::getStringOr(p, "content_type", "all");
    auto contentType = contentTypeFromString(type);
    if (!contentType)
        return std::unexpected(queryError(std::format("Unknown content_type '{}'", type)));
    query.contentType = *contentType;

    auto start = timestampParam(p, "start_time");
    if (!start)
        return std::unexpected(start.error());
    query.start = *start;

    auto end = timestampParam(p, "end_time");
    if (!end)
        return std::unexpected(end.error());
    query.end = *end;

    query.appName = optionalString(p, "app_name");
    query.windowName = optionalString(p, "window_name");

    auto limit = integerParam(p, "limit", DefaultSearchLimit);
    if (!limit)
        return std::unexpected(limit.error());
    query.limit = *limit;

    auto offset = integerParam(p, "offset", 0);
    if (!offset)
        return std::unexpected(offset.error());
    query.offset = *offset;

    query.includeFrames = json::getBoolOr(p, "include_frames", false);
    return query;
}

auto toJson(const SearchResult& result) -> nlohmann::json
{
    struct Visitor
    {
        auto operator()(const OcrResult& r) const -> nlohmann::json
        {
            return { { "type", "OCR" },
                     { "content",
                       { { "frame_id", r.frameId },
                         { "text", r.text },
                         { "timestamp", formatTimestamp(r.timestamp) },
                         { "file_path", r.filePath },
                         { "offset_index", r.offsetIndex },
                         { "app_name", r.appName },
                         { "window_name", r.windowName },
                         { "focused", r.focused },
                         { "tags", r.tags },
                         { "frame", optionalJson(r.frame) } } } };
        }

        auto operator()(const AudioResult& r) const -> nlohmann::json
        {
            return { { "type", "Audio" },
                     { "content",
                       { { "chunk_id", r.chunkId },
                         { "transcription", r.transcription },
                         { "timestamp", formatTimestamp(r.timestamp) },
                         { "file_path", r.filePath },
                         { "offset_index", r.offsetIndex },
                         { "device_name", r.deviceName },
                         { "device_type", r.isInputDevice ? "input" : "output" },
                         { "tags", r.tags } } } };
        }

        auto operator()(const FtsResult& r) const -> nlohmann::json
        {
            return { { "type", "FTS" },
                     { "content",
                       { { "text_id", r.textId },
                         { "matched_text", r.matchedText },
                         { "frame_id", r.frameId },
                         { "timestamp", formatTimestamp(r.timestamp) },
                         { "app_name", r.appName },
                         { "window_name", r.windowName },
                         { "file_path", r.filePath },
                         { "offset_index", r.offsetIndex },
                         { "original_frame_text", optionalJson(r.originalFrameText) },
                         { "tags", r.tags } } } };
        }
    };

    return std::visit(Visitor {}, result);
}

auto toJson(const SearchPage& page) -> nlohmann::json
{
    auto data = nlohmann::json::array();
    for (auto const& result: page.results)
        data.push_back(toJson(result));

    return { { "data", std::move(data) },
             { "pagination", { { "limit", page.limit }, { "offset", page.offset }, { "total", page.total } } } };
}

auto toJson(const HealthReport& report) -> nlohmann::json
{
    return { { "status", overallStatusToString(report.status) },
             { "last_frame_timestamp", timestampJson(report.lastFrame) },
             { "last_audio_timestamp", timestampJson(report.lastAudio) },
             { "frame_status", modalityStatusToString(report.frameStatus) },
             { "audio_status", modalityStatusToString(report.audioStatus) },
             { "message", report.message },
             { "verbose_instructions", optionalJson(report.verboseInstructions) } };
}

ServiceApi::ServiceApi(RetrievalService& retrieval,
                       Archive& archive,
                       DeviceRegistry& registry,
                       HealthMonitor& health,
                       CaptureControl& control):
    _retrieval(retrieval), _archive(archive), _registry(registry), _health(health), _control(control)
{
}

auto ServiceApi::search(const nlohmann::json& params) -> Result<nlohmann::json>
{
    auto query = parseSearchQuery(params);
    if (!query)
        return std::unexpected(query.error());

    auto page = _retrieval.search(*query);
    if (!page)
        return std::unexpected(page.error());
    return toJson(*page);
}

auto ServiceApi::listAudioDevices() -> Result<nlohmann::json>
{
    auto devices = _registry.listAudioDevices();
    if (!devices)
        return std::unexpected(devices.error());
    if (devices->empty())
        return makeError(ErrorCode::NotFound, "No audio devices found");

    auto result = nlohmann::json::array();
    for (auto const& info: *devices)
        result.push_back({ { "name", info.device.id() }, { "is_default", info.isDefault } });
    return result;
}

auto ServiceApi::listMonitors() -> Result<nlohmann::json>
{
    auto monitors = _registry.listMonitors();
    if (!monitors)
        return std::unexpected(monitors.error());

    auto result = nlohmann::json::array();
    for (auto const& monitor: *monitors)
        result.push_back({ { "id", monitor.id },
                           { "name", monitor.name },
                           { "width", monitor.width },
                           { "height", monitor.height },
                           { "is_default", monitor.isDefault } });
    return result;
}

auto ServiceApi::changeTags(const nlohmann::json& params, bool add) -> Result<nlohmann::json>
{
    if (!params.is_object())
        return makeError(ErrorCode::InvalidArgument, "Tag parameters must be an object");

    auto const typeName = json::getStringOr(params, "content_type", "");
    auto type = tagContentTypeFromString(typeName);
    if (!type)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid content type '{}'", typeName));

    if (!params.contains("id") || !params["id"].is_number_integer())
        return makeError(ErrorCode::InvalidArgument, "'id' must be an integer");
    auto const id = params["id"].get<std::int64_t>();

    if (!params.contains("tags") || !params["tags"].is_array())
        return makeError(ErrorCode::InvalidArgument, "'tags' must be an array of strings");
    auto const tags = json::getStringList(params, "tags");

    auto result = add ? _archive.addTags(id, *type, tags) : _archive.removeTags(id, *type, tags);
    if (!result)
        return std::unexpected(result.error());
    return nlohmann::json { { "success", true } };
}

auto ServiceApi::addTags(const nlohmann::json& params) -> Result<nlohmann::json>
{
    return changeTags(params, true);
}

auto ServiceApi::removeTags(const nlohmann::json& params) -> Result<nlohmann::json>
{
    return changeTags(params, false);
}

auto ServiceApi::health() -> nlohmann::json
{
    return toJson(_health.check());
}

auto ServiceApi::pauseVision() -> nlohmann::json
{
    _control.pauseVision();
    log::info("Vision capture paused");
    return { { "success", true }, { "paused", true } };
}

auto ServiceApi::resumeVision() -> nlohmann::json
{
    _control.resumeVision();
    log::info("Vision capture resumed");
    return { { "success", true }, { "paused", false } };
}

auto ServiceApi::setDeviceState(const nlohmann::json& params) -> Result<nlohmann::json>
{
    auto id = json::getString(params, "device");
    if (!id)
        return makeError(ErrorCode::InvalidArgument, "'device' is required");

    auto device = parseAudioDevice(*id);
    if (!device)
        return makeError(ErrorCode::InvalidArgument, device.error().message);

    auto const stateName = json::getStringOr(params, "state", "");
    auto state = deviceStateFromString(stateName);
    if (!state)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid device state '{}'", stateName));

    _registry.setDeviceState(*device, *state);
    return nlohmann::json { { "success", true } };
}

auto ServiceApi::dispatch(std::string_view method, const nlohmann::json& params) -> Result<nlohmann::json>
{
    if (method == "search")
        return search(params);
    if (method == "listAudioDevices")
        return listAudioDevices();
    if (method == "listMonitors")
        return listMonitors();
    if (method == "addTags")
        return addTags(params);
    if (method == "removeTags")
        return removeTags(params);
    if (method == "health")
        return health();
    if (method == "pauseVision")
        return pauseVision();
    if (method == "resumeVision")
        return resumeVision();
    if (method == "setDeviceState")
        return setDeviceState(params);
    return makeError(ErrorCode::NotFound, std::format("Method not found: {}", method));
}

auto ServiceApi::handleMessage(std::string_view line) -> std::optional<nlohmann::json>
{
    auto message = json::parse(line);
    if (!message)
        return jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, message.error().message);

    auto request = jsonrpc::parseRequest(*message);
    if (!request)
        return jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::InvalidRequest, request.error().message);

    if (std::ranges::find(Methods, request->method) == Methods.end())
    {
        if (request->isNotification())
            return std::nullopt;
        return jsonrpc::makeErrorResponse(
            request->id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", request->method));
    }

    auto result = dispatch(request->method, request->params);
    if (request->isNotification())
    {
        if (!result)
            log::warning("Notification '{}' failed: {}", request->method, result.error());
        return std::nullopt;
    }

    if (!result)
        return errorResponse(request->id, result.error());
    return jsonrpc::makeResult(request->id, std::move(*result));
}

auto ServiceApi::serve(int inputFd, int outputFd, std::stop_token stop) -> VoidResult
{
    auto pending = std::string {};
    auto buf = std::array<char, 4096> {};

    while (!stop.stop_requested())
    {
        auto pfd = pollfd { .fd = inputFd, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, 200);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::IoError, std::format("poll failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto const bytesRead = ::read(inputFd, buf.data(), buf.size());
        if (bytesRead < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return makeError(ErrorCode::IoError, std::format("read failed: {}", strerror(errno)));
        }
        if (bytesRead == 0)
        {
            log::info("API input closed");
            return {};
        }

        pending.append(buf.data(), static_cast<size_t>(bytesRead));

        auto newline = pending.find('\n');
        while (newline != std::string::npos)
        {
            auto const line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            newline = pending.find('\n');

            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;

            if (auto response = handleMessage(line); response)
            {
                if (auto written = writeAll(outputFd, response->dump() + "\n"); !written)
                    return written;
            }
        }
    }
    return {};
}

} // namespace sightline
