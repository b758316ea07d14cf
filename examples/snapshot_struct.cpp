/**
 * @file snapshot_struct.cpp
 * @brief 演示用户结构体、枚举与变体的静态 schema 编解码
 *
 * 要点：
 * - 结构体通过 BITWIRE_FIELDS 按声明顺序列出字段，无字段名、无对齐；
 * - 特化 enum_traits 的枚举按最少位数编码；
 * - std::variant 以最少位数的标签选择分支；
 * - bitwire::Buffer 在多次编码之间复用存储。
 */

#include <bitwire/serialize.hpp>
#include <bitwire/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class Team : std::uint8_t { red, blue, spectator };

template <>
struct bitwire::schema::enum_traits<Team> {
    static constexpr std::size_t count = 3;
};

namespace {

struct Player {
    std::uint16_t id{};
    Team team{Team::spectator};
    bitwire::Ranged<std::int32_t, -1000, 1000> x{};
    bitwire::Ranged<std::int32_t, -1000, 1000> y{};
    bool alive{};
    BITWIRE_FIELDS(id, team, x, y, alive)
};

struct Join {
    std::string name;
    BITWIRE_FIELDS(name)
};

struct Leave {
    std::uint16_t id{};
    BITWIRE_FIELDS(id)
};

using Event = std::variant<Join, Leave>;

struct Snapshot {
    std::uint32_t tick{};
    std::vector<Player> players;
    std::map<std::string, std::int32_t> scores;
    std::optional<Event> event;
    BITWIRE_FIELDS(tick, players, scores, event)
};

Snapshot make_snapshot(std::uint32_t tick) {
    Snapshot s;
    s.tick = tick;
    s.players.push_back({1, Team::red, {120}, {-45}, true});
    s.players.push_back({2, Team::blue, {-999}, {1000}, tick % 2 == 0});
    s.scores = {{"red", 3}, {"blue", -1}};
    if (tick % 3 == 0) {
        s.event = Event{Join{"carol"}};
    }
    return s;
}

} // namespace

int main() {
    std::cout << "=== bitwire 结构体快照示例 ===\n\n";

    bitwire::Buffer buffer;
    for (std::uint32_t tick = 1; tick <= 3; ++tick) {
        const auto bytes = buffer.encode(make_snapshot(tick));
        std::cout << "tick " << tick << ": " << bytes.size() << " 字节\n"
                  << bitwire::utils::hex_dump(bytes) << "\n";

        Snapshot out;
        const auto ec = buffer.decode(bytes, out);
        if (ec) {
            std::cerr << "解码失败: " << ec.message() << "\n";
            return 1;
        }
        std::cout << "  players=" << out.players.size() << " first.x="
                  << out.players.front().x.value << " event="
                  << (out.event ? (std::holds_alternative<Join>(*out.event) ? "join" : "leave")
                                : "none")
                  << "\n\n";
    }
    return 0;
}
