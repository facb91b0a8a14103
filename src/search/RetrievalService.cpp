// SPDX-License-Identifier: Apache-2.0
#include "RetrievalService.hpp"

#include <core/Base64.hpp>
#include <core/Log.hpp>
#include <storage/ChunkFile.hpp>

#include <format>

namespace sightline
{

RetrievalService::RetrievalService(Archive& archive, FramePolicy framePolicy):
    _archive(archive), _framePolicy(framePolicy)
{
}

auto RetrievalService::normalize(SearchQuery query) -> Result<SearchQuery>
{
    if (query.limit < 1 || query.limit > MaxSearchLimit)
        return makeError(ErrorCode::QueryError,
                         std::format("limit must be between 1 and {}, got {}", MaxSearchLimit, query.limit));
    if (query.offset < 0)
        return makeError(ErrorCode::QueryError, std::format("offset must not be negative, got {}", query.offset));
    if (query.start && query.end && *query.start > *query.end)
        return makeError(ErrorCode::QueryError,
                         std::format("start_time {} is after end_time {}",
                                     formatTimestamp(*query.start),
                                     formatTimestamp(*query.end)));

    if (query.appName && query.appName->empty())
        query.appName.reset();
    if (query.windowName && query.windowName->empty())
        query.windowName.reset();

    if (query.appName || query.windowName)
        query.contentType = ContentType::Ocr;

    return query;
}

auto RetrievalService::search(const SearchQuery& request) -> Result<SearchPage>
{
    auto query = normalize(request);
    if (!query)
        return std::unexpected(query.error());

    log::debug("Search: text='{}' type={} limit={} offset={} app={} window={}",
               query->text,
               contentTypeToString(query->contentType),
               query->limit,
               query->offset,
               query->appName.value_or(""),
               query->windowName.value_or(""));

    auto results = _archive.search(*query);
    if (!results)
        return std::unexpected(results.error());

    auto total = _archive.countSearchResults(*query);
    if (!total)
        return std::unexpected(total.error());

    if (query->includeFrames)
    {
        for (auto& result: *results)
        {
            auto* ocr = std::get_if<OcrResult>(&result);
            if (!ocr)
                continue;

            auto frame = loadFrame(ocr->filePath, ocr->offsetIndex);
            if (frame)
            {
                ocr->frame = std::move(*frame);
                continue;
            }

            if (_framePolicy == FramePolicy::FailBatch)
                return std::unexpected(frame.error());
            log::warning("Frame {} ({}:{}) unavailable: {}", ocr->frameId, ocr->filePath, ocr->offsetIndex, frame.error());
        }
    }

    log::debug("Search completed: {} of {} results", results->size(), *total);
    return SearchPage {
        .results = std::move(*results),
        .total = *total,
        .limit = query->limit,
        .offset = query->offset,
    };
}

auto RetrievalService::loadFrame(const std::string& path, std::int64_t offset) const -> Result<std::string>
{
    auto kind = ChunkReader::readKind(path);
    if (!kind)
        return std::unexpected(kind.error());
    if (*kind != StreamKind::Video)
        return makeError(ErrorCode::IoError, std::format("'{}' is not a video chunk", path));

    auto record = ChunkReader::readUnit(path, offset);
    if (!record)
        return std::unexpected(record.error());
    if (record->payload.empty())
        return makeError(ErrorCode::IoError, std::format("Frame {}:{} is empty", path, offset));

    return base64::encode(record->payload);
}

} // namespace sightline
