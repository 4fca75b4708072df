#include "core/GameConfig.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>

namespace blokus::core {

namespace {

TileColor colorFromGlyph(char glyph) {
    switch (glyph) {
    case 'R': case 'r': return TileColor::Red;
    case 'Y': case 'y': return TileColor::Yellow;
    case 'G': case 'g': return TileColor::Green;
    case 'B': case 'b': return TileColor::Blue;
    default:
        throw std::invalid_argument(std::string("Unknown color glyph: ") + glyph);
    }
}

int parseCount(const std::string& text) {
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--players expects a number, got: " + text);
    }
    if (used != text.size()) {
        throw std::invalid_argument("--players expects a number, got: " + text);
    }
    return value;
}

} // namespace

std::vector<TileColor> defaultColorOrder() {
    return {TileColor::Red, TileColor::Blue, TileColor::Yellow, TileColor::Green};
}

void validate(const GameConfig& config) {
    if (config.playerCount < MinPlayers || config.playerCount > MaxPlayers) {
        throw std::invalid_argument("GameConfig: player count must be between 2 and 4");
    }
    if (config.colorOrder.size() < static_cast<std::size_t>(config.playerCount)) {
        throw std::invalid_argument("GameConfig: not enough colors for every seat");
    }

    const auto seats = seatColors(config);
    for (auto it = seats.begin(); it != seats.end(); ++it) {
        if (!isPlayerColor(*it)) {
            throw std::invalid_argument("GameConfig: seat color must be a player color");
        }
        if (std::find(std::next(it), seats.end(), *it) != seats.end()) {
            throw std::invalid_argument("GameConfig: seat colors must be distinct");
        }
    }
}

std::vector<TileColor> seatColors(const GameConfig& config) {
    const auto n = std::min(config.colorOrder.size(),
                            static_cast<std::size_t>(std::max(config.playerCount, 0)));
    return {config.colorOrder.begin(), config.colorOrder.begin() + static_cast<std::ptrdiff_t>(n)};
}

GameConfig parseArgs(const std::vector<std::string>& args) {
    GameConfig config;
    bool orderGiven = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "demo") {
            config.playerCount = 4;
            config.colorOrder = {TileColor::Blue, TileColor::Yellow,
                                 TileColor::Red, TileColor::Green};
            orderGiven = true;
        } else if (arg == "--players") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("--players expects a value");
            }
            config.playerCount = parseCount(args[++i]);
        } else if (arg == "--order") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("--order expects a value");
            }
            const std::string& glyphs = args[++i];
            config.colorOrder.clear();
            for (char g : glyphs) {
                config.colorOrder.push_back(colorFromGlyph(g));
            }
            orderGiven = true;
        } else if (arg == "--clear-on-failure") {
            config.keepSelectionOnFailure = false;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    // A short explicit order also fixes the seat count
    if (orderGiven && config.colorOrder.size() < static_cast<std::size_t>(config.playerCount)) {
        config.playerCount = static_cast<int>(config.colorOrder.size());
    }

    validate(config);
    return config;
}

} // namespace blokus::core
