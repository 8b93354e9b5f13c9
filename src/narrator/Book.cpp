// SPDX-License-Identifier: Apache-2.0
#include "Book.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace narrator
{

auto Book::chapterIds() const -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    ids.reserve(chapters.size());
    for (auto const& chapter: chapters)
        ids.push_back(chapter.id);
    return ids;
}

auto parseBook(std::string_view text) -> Result<Book>
{
    auto parsed = json::parse(text);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    if (!root.is_object() || !root.contains("chapters") || !root["chapters"].is_array())
        return makeError(ErrorCode::FormatError, "Book manifest needs a \"chapters\" array");

    auto book = Book {
        .id = json::getStringOr(root, "id", ""),
        .title = json::getStringOr(root, "title", "Untitled"),
        .author = json::getStringOr(root, "author", ""),
        .chapters = {},
    };

    auto chapterIds = std::set<std::string> {};
    for (auto const& chapterJson: root["chapters"])
    {
        auto chapterId = json::getString(chapterJson, "id");
        if (!chapterId)
            return makeError(ErrorCode::FormatError,
                             std::format("Chapter {}: {}", book.chapters.size(), chapterId.error().message));
        if (!chapterIds.insert(*chapterId).second)
            return makeError(ErrorCode::FormatError, std::format("Duplicate chapter id: {}", *chapterId));

        auto chapter = ChapterInput {
            .id = *chapterId,
            .title = json::getStringOr(chapterJson, "title", *chapterId),
            .segments = {},
        };

        if (chapterJson.contains("segments") && chapterJson["segments"].is_array())
        {
            auto indices = std::set<int> {};
            for (auto const& segmentJson: chapterJson["segments"])
            {
                auto const position = static_cast<int>(chapter.segments.size());
                auto segmentText = json::getString(segmentJson, "text");
                if (!segmentText)
                    return makeError(ErrorCode::FormatError,
                                     std::format("Chapter {} segment {}: {}", chapter.id, position, segmentText.error().message));

                auto const index = json::getIntOr(segmentJson, "index", position);
                if (index < 0 || !indices.insert(index).second)
                    return makeError(ErrorCode::FormatError,
                                     std::format("Chapter {} has an invalid or duplicate segment index {}", chapter.id, index));

                chapter.segments.push_back(TextSegment {
                    .index = index,
                    .text = std::move(*segmentText),
                    .id = json::getStringOr(segmentJson, "id", std::format("{}-{}", chapter.id, index)),
                });
            }
        }

        book.chapters.push_back(std::move(chapter));
    }

    return book;
}

auto loadBookFromFile(std::string_view path) -> Result<Book>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open book manifest: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto book = parseBook(ss.str());
    if (!book)
        return makeError(book.error().code, std::format("{}: {}", path, book.error().message));

    if (book->id.empty())
        book->id = std::filesystem::path(path).stem().string();
    return book;
}

} // namespace narrator
