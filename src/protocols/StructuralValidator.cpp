/* @file StructuralValidator.cpp
 * @brief Loop/tag shape checks run before any resolution happens.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>

// cycleflow headers
#include "protocols/ProtocolErrors.hpp"
#include "protocols/StructuralValidator.hpp"

namespace cycleflow::protocols {

  namespace {

    // true if method[first, last) holds nothing but tags (or nothing at all)
    bool onlyTags(const std::vector<Step>& method, std::size_t first, std::size_t last) {
      return std::all_of(method.begin() + static_cast<std::ptrdiff_t>(first),
                         method.begin() + static_cast<std::ptrdiff_t>(last), isTag);
    }

    void rejectDuplicateTags(const std::vector<Step>& method) {
      std::map<std::string, int> seen;
      for (const auto& step : method)
        if (const auto* tag = std::get_if<Tag>(&step))
          ++seen[tag->name()];

      std::string dupes;
      for (const auto& [name, count] : seen) {
        if (count < 2)
          continue;
        if (!dupes.empty())
          dupes += ", ";
        dupes += "'" + name + "'";
      }
      if (!dupes.empty())
        throw StructuralError("Duplicate tags: " + dupes);
    }

  } // namespace

  void validateStructure(const std::vector<Step>& method) {
    if (method.empty())
      throw StructuralError("Protocol method must contain at least one step.");

    rejectDuplicateTags(method);

    std::unordered_map<std::string, std::size_t> tagIndex;
    for (std::size_t i = 0; i < method.size(); ++i)
      if (const auto* tag = std::get_if<Tag>(&method[i]))
        tagIndex.emplace(tag->name(), i);

    // indexed loops: strictly backwards and with something to repeat
    for (std::size_t i = 0; i < method.size(); ++i) {
      const auto* loop = std::get_if<Loop>(&method[i]);
      if (!loop || loop->isSymbolic())
        continue;
      const std::size_t pos = i + 1;
      const std::size_t start = loop->position();
      if (start >= pos)
        throw StructuralError("Loop start index " + std::to_string(start) +
                              " cannot be on or after the loop index " + std::to_string(pos) + ".");
      if (onlyTags(method, start - 1, i))
        throw StructuralError("Loop start index " + std::to_string(start) +
                              " leaves an empty loop body at " + std::to_string(pos) + ".");
    }

    // tagged loops: tag exists, precedes the loop, and is not directly before it
    for (std::size_t i = 0; i < method.size(); ++i) {
      const auto* loop = std::get_if<Loop>(&method[i]);
      if (!loop || !loop->isSymbolic())
        continue;
      const std::string& name = loop->tagName();
      auto it = tagIndex.find(name);
      if (it == tagIndex.end())
        throw MissingTagError(name, "Tag '" + name + "' is missing.");
      const std::size_t tagI = it->second;
      if (i <= tagI)
        throw StructuralError("Loops must go backwards, '" + name + "' goes forwards (" +
                              std::to_string(i + 1) + "->" + std::to_string(tagI + 1) + ").");
      if (onlyTags(method, tagI + 1, i))
        throw StructuralError("Loop '" + name + "' cannot start immediately after its tag.");
    }
  }

} // namespace cycleflow::protocols
