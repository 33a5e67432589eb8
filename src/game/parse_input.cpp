#include "game/parse_input.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace {
std::string getLinePrefix(int lineNumber) {
    return (lineNumber > 0) ? ("Line " + std::to_string(lineNumber) + ": ") : "";
}

Result<Showdown, InputError> buildShowdownFromTokens(const std::vector<std::string>& tokens, int lineNumber) {
    if (static_cast<int>(tokens.size()) != showdown::CardsPerShowdown) {
        return InputError{
            .type = InputErrorType::MalformedLine,
            .lineNumber = lineNumber,
            .message = getLinePrefix(lineNumber) + "Expected exactly " + std::to_string(showdown::CardsPerShowdown)
                + " cards, got " + std::to_string(tokens.size()) + "."
        };
    }

    std::vector<std::string> hand1Strings(tokens.begin(), tokens.begin() + showdown::HandSize);
    std::vector<std::string> hand2Strings(tokens.begin() + showdown::HandSize, tokens.end());

    Result<Hand, InputError> hand1Result = buildHandFromStrings(hand1Strings, lineNumber);
    if (hand1Result.isError()) {
        return hand1Result.getError();
    }

    Result<Hand, InputError> hand2Result = buildHandFromStrings(hand2Strings, lineNumber);
    if (hand2Result.isError()) {
        return hand2Result.getError();
    }

    return Showdown{ .hand1 = hand1Result.getValue(), .hand2 = hand2Result.getValue() };
}
} // namespace

std::string getInputErrorTypeName(InputErrorType type) {
    switch (type) {
        case InputErrorType::MalformedLine:
            return "Malformed line";
        case InputErrorType::InvalidCardCode:
            return "Invalid card code";
        default:
            assert(false);
            return "";
    }
}

Result<Hand, InputError> buildHandFromStrings(const std::vector<std::string>& cardStrings, int lineNumber) {
    if (static_cast<int>(cardStrings.size()) != showdown::HandSize) {
        return InputError{
            .type = InputErrorType::MalformedLine,
            .lineNumber = lineNumber,
            .message = getLinePrefix(lineNumber) + "A hand must contain exactly " + std::to_string(showdown::HandSize) + " cards."
        };
    }

    Hand hand{};
    for (int i = 0; i < showdown::HandSize; ++i) {
        Result<Card> cardResult = getCardFromName(cardStrings[i]);
        if (cardResult.isError()) {
            return InputError{
                .type = InputErrorType::InvalidCardCode,
                .lineNumber = lineNumber,
                .message = getLinePrefix(lineNumber) + cardResult.getError()
            };
        }
        hand[i] = cardResult.getValue();
    }

    // Duplicate cards are allowed, each player may be dealt from a separate deck
    return hand;
}

Result<std::optional<Showdown>, InputError> parseShowdownLine(const std::string& line, int lineNumber) {
    std::vector<std::string> tokens = parseWhitespaceTokens(line);
    if (tokens.empty()) {
        return std::optional<Showdown>{};
    }

    Result<Showdown, InputError> showdownResult = buildShowdownFromTokens(tokens, lineNumber);
    if (showdownResult.isError()) {
        return showdownResult.getError();
    }

    return std::optional<Showdown>{ showdownResult.getValue() };
}

Result<Showdown, InputError> buildShowdownFromString(const std::string& showdownString) {
    return buildShowdownFromTokens(parseTokens(showdownString, ','), 0);
}
