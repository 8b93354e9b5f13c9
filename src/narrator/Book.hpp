// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <generation/GenerationSession.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief A pre-segmented book as read from a manifest file.
struct Book
{
    /// Store scope; the manifest's `id`, or the file name stem.
    std::string id;
    std::string title;
    std::string author;
    std::vector<ChapterInput> chapters;

    [[nodiscard]] auto chapterIds() const -> std::vector<std::string>;
};

/// @brief Parses a book manifest.
///
/// Format: `{id?, title, author?, chapters: [{id, title?, segments: [{index?, text, id?}]}]}`.
/// A missing segment index defaults to its position, a missing segment id to `<chapter>-<index>`.
/// @return The book, or a FormatError naming the offending chapter or segment.
[[nodiscard]] auto parseBook(std::string_view text) -> Result<Book>;

/// @brief Reads and parses a book manifest file.
[[nodiscard]] auto loadBookFromFile(std::string_view path) -> Result<Book>;

} // namespace narrator
