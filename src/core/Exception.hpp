//
// Created by Malik T on 14/08/2025.
//

#ifndef CONQUESTGAME_EXCEPTION_HPP
#define CONQUESTGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace conquest::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Config, // game constructed with an unusable configuration
        Geography, // geography provider handed over a malformed map
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct GeographyError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Geography: throw GeographyError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define CNQ_THROW(code_enum, msg) ::conquest::core::error::fail((code_enum), (msg))
#define CNQ_ASSERT(cond, msg) do { if(!(cond)) ::conquest::core::error::fail(::conquest::core::error::Code::Assertion, (msg)); } while(0)

    // Coarse category a presentation layer can branch on.
    enum class ErrorKind : uint8_t
    {
        InvalidState,
        InvalidArgument,
        NotFound
    };

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongStage,
        Skip_NotSkippable,
        Territory_NotFound,
        Territory_NotOwned,

        // Claim / Populate / Draft
        Claim_AlreadyOwned,
        Populate_NoArmiesLeft,
        Draft_CountOutOfRange,

        // Attack
        Attack_OwnTerritory,
        Attack_NotAdjacent,
        Attack_AttackersOutOfRange,
        Attack_DefendersOutOfRange,

        // Invade / Maneuver
        Invade_CountOutOfRange,
        Maneuver_NotAdjacent,
        Maneuver_CountOutOfRange,

        // Cards
        TradeIn_StarsOutOfRange,
        TradeIn_OddWithoutSingles,
        Stars_OutOfRange
    };

    inline auto kind_of(RuleViolationCode const c) -> ErrorKind
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongStage:
        case E::Skip_NotSkippable:
            return ErrorKind::InvalidState;
        case E::Territory_NotFound:
            return ErrorKind::NotFound;
        default:
            return ErrorKind::InvalidArgument;
        }
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Stage> stage{};
        std::optional<Stage> expected_stage{};
        std::optional<PlyrIdxT> actor{};
        std::optional<TerrIdxT> territory{};

        // Small integers useful in error messages
        std::optional<std::int32_t> attempted_count{};
        std::optional<std::int32_t> limit{};

        [[nodiscard]]
        auto Kind() const -> ErrorKind { return kind_of(code); }

        // Quick helpers to build enriched violations (fluent style).
        auto with_stage(Stage s) -> RuleViolation&
        {
            stage = s;
            return *this;
        }

        auto with_expected(Stage s) -> RuleViolation&
        {
            expected_stage = s;
            return *this;
        }

        auto with_actor(PlyrIdxT p) -> RuleViolation&
        {
            actor = p;
            return *this;
        }

        auto with_territory(TerrIdxT t) -> RuleViolation&
        {
            territory = t;
            return *this;
        }

        auto with_attempted(std::int32_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_limit(std::int32_t v) -> RuleViolation&
        {
            limit = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::WrongStage: return "Wrong stage for this action";
        case E::Skip_NotSkippable: return "Skip: current stage cannot be skipped";
        case E::Territory_NotFound: return "Territory not part of this map";
        case E::Territory_NotOwned: return "Territory not owned by acting player";

        case E::Claim_AlreadyOwned: return "Claim: territory already claimed";
        case E::Populate_NoArmiesLeft: return "Populate: no armies left to place";
        case E::Draft_CountOutOfRange: return "Draft: army count out of range";

        // Attack
        case E::Attack_OwnTerritory: return "Attack: cannot attack own territory";
        case E::Attack_NotAdjacent: return "Attack: territories are not adjacent";
        case E::Attack_AttackersOutOfRange: return "Attack: attacker count out of range";
        case E::Attack_DefendersOutOfRange: return "Attack: defender count out of range";

        case E::Invade_CountOutOfRange: return "Invade: army count out of range";
        case E::Maneuver_NotAdjacent: return "Maneuver: territories are not adjacent";
        case E::Maneuver_CountOutOfRange: return "Maneuver: army count out of range";

        // Cards
        case E::TradeIn_StarsOutOfRange: return "TradeIn: star count out of range";
        case E::TradeIn_OddWithoutSingles: return "TradeIn: odd star count needs a single-star card";
        case E::Stars_OutOfRange: return "Stars: value outside 2..10";
        }
        return "Unknown";
    }

    inline auto to_string(ErrorKind k) -> std::string_view
    {
        switch (k)
        {
        case ErrorKind::InvalidState: return "InvalidState";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::NotFound: return "NotFound";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        std::string s{to_string(v.Kind())};
        s += ": ";
        s += to_string(v.code);
        if (v.stage) (s += " | stage=") += to_string(*v.stage);
        if (v.expected_stage) (s += " | expected=") += to_string(*v.expected_stage);
        if (v.actor) s += " | actor=P" + std::to_string(static_cast<int>(*v.actor));
        if (v.territory) s += " | terr=" + std::to_string(static_cast<int>(*v.territory));
        if (v.attempted_count) s += " | attempted=" + std::to_string(*v.attempted_count);
        if (v.limit) s += " | limit=" + std::to_string(*v.limit);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    template <typename T>
    using ActionResult = std::expected<T, RuleViolation>;
}

#endif //CONQUESTGAME_EXCEPTION_HPP
