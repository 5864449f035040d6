#pragma once
/** @file  ProtocolErrors.hpp
 *  @brief Exception hierarchy for malformed protocol definitions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <compare>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace cycleflow {
  namespace protocols {

    /**
 * @class ProtocolError
 * @brief Root of every error the resolution engine raises.
 *
 *  * All of them describe a caller-fixable input error; none are retried.
 */
    class ProtocolError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Invalid step or sequence shape, detected at construction.
    class StructuralError : public ProtocolError {
    public:
      using ProtocolError::ProtocolError;
    };

    /// A loop names a tag that does not exist (or does not precede it).
    class MissingTagError : public StructuralError {
    public:
      MissingTagError(std::string tag, const std::string& message)
          : StructuralError(message), tag_(std::move(tag)) {}

      const std::string& tag() const { return tag_; }

    private:
      std::string tag_;
    };

    class MissingCapacityError : public ProtocolError {
    public:
      MissingCapacityError() : ProtocolError("Sample capacity must be set if using C-rate steps.") {}
    };

    /// Inclusive `[start, end]` span of a loop, 1-based positions of a resolved sequence.
    struct LoopInterval {
      std::size_t start{ 0 };
      std::size_t end{ 0 };

      auto operator<=>(const LoopInterval&) const = default;
    };

    class IntersectingLoopsError : public ProtocolError {
    public:
      IntersectingLoopsError(LoopInterval first, LoopInterval second);

      LoopInterval first() const { return first_; }
      LoopInterval second() const { return second_; }

    private:
      LoopInterval first_;
      LoopInterval second_;
    };

    class RunawayExpansionError : public ProtocolError {
    public:
      RunawayExpansionError(std::size_t iterations, std::size_t limit);

      std::size_t iterations() const { return iterations_; }
      std::size_t limit() const { return limit_; }

    private:
      std::size_t iterations_;
      std::size_t limit_;
    };

    /// Thrown by consumers (exporters) that have no rendering for a step kind.
    class UnsupportedStepError : public ProtocolError {
    public:
      UnsupportedStepError(std::string_view consumer, std::string_view stepKind);

      const std::string& stepKind() const { return stepKind_; }

    private:
      std::string stepKind_;
    };

  } // namespace protocols
} // namespace cycleflow
