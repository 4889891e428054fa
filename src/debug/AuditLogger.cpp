#include "AuditLogger.hpp"

#include <string_view>
#include <type_traits>
#include <variant>

using namespace conquest::core;

namespace
{

auto s_num(std::int64_t const v) -> std::string
{
    return std::to_string(v);
}

auto s_move(TerrIdxT const from, TerrIdxT const to) -> std::string
{
    return s_num(from) + "->" + s_num(to);
}

auto s_owner(TerritoryInfo const& t) -> std::string
{
    return t.owner ? "P" + s_num(*t.owner) : std::string("--");
}

auto serialize_board(GameSnapshot const& s) -> std::string
{
    std::string serial;
    for (size_t i{}; i < s.territories.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += s_owner(s.territories[i]) + ":" + s_num(s.territories[i].armies);
    }
    return serial;
}

} // anonymous namespace

namespace conquest::core::debug
{

auto DescribeAction(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, ClaimAction>)
            {
                return "Claim(" + s_num(act.territory) + ")";
            }
            else if constexpr (std::is_same_v<T, PopulateAction>)
            {
                return "Populate(" + s_num(act.territory) + ")";
            }
            else if constexpr (std::is_same_v<T, DraftAction>)
            {
                return "Draft(" + s_num(act.territory) + " x" + s_num(act.count) + ")";
            }
            else if constexpr (std::is_same_v<T, AttackAction>)
            {
                return "Attack(" + s_move(act.from, act.to) + " " + s_num(act.attackers) + "v" +
                       s_num(act.defenders) + ")";
            }
            else if constexpr (std::is_same_v<T, InvadeAction>)
            {
                return "Invade(x" + s_num(act.count) + ")";
            }
            else if constexpr (std::is_same_v<T, ManeuverAction>)
            {
                return "Maneuver(" + s_move(act.from, act.to) + " x" + s_num(act.count) + ")";
            }
            else if constexpr (std::is_same_v<T, TradeInAction>)
            {
                return "TradeIn(" + s_num(act.stars) + " stars)";
            }
            else
            {
                return "Skip";
            }
        },
        a
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Game const& game, uint64_t seed) -> void
{
    out_ << "Seed=" << seed << "\n";
    out_ << "Territories=" << game.TerritoryCount() << "\n";
    out_ << "Players=" << game.PlayerCount() << "\n";
    for (PlayerState const& p : game.Players())
    {
        out_ << "  P" << static_cast<int>(p.index) << "=" << p.name << "\n";
    }
    out_.flush();
}

auto AuditLogger::turn(GameSnapshot const& s, PlayerAction const& a) -> void
{
    PlayerState const& p = s.players.at(s.current_player);
    out_ << "Turn actor=P" << static_cast<int>(s.current_player)
         << " stage=" << to_string(s.stage)
         << " draft=" << p.draft_armies
         << " stars=" << p.Stars()
         << " board=[" << serialize_board(s) << "]\n";

    out_ << "Action: " << DescribeAction(a) << "\n";
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied  ? "Applied" :
        (m == MoveOutcome::Captured ? "Captured" : "GameEnded"));
    out_ << "Outcome: " << txt << "\n";
}

auto AuditLogger::rejected(error::RuleViolation const& v) -> void
{
    out_ << "Rejected: " << error::describe(v) << "\n";
}

auto AuditLogger::end(Game const& game) -> void
{
    int winner = -1;
    if (game.StageNow() == Stage::Finished)
    {
        for (PlayerState const& p : game.Players())
        {
            if (!p.defeated) winner = p.index;
        }
    }

    std::string body;
    for (PlayerState const& p : game.Players())
    {
        body += (p.index ? "," : "");
        body += "P" + s_num(p.index) + ":" + s_num(p.owned_territories) + (p.defeated ? "x" : "");
    }

    out_ << "Standings=[" << body << "]\n";
    out_ << "Winner=" << winner << "\n";
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace conquest::core::debug
