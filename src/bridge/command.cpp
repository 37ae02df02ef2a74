#include "command.h"

#include <player/player_types.h>
#include <algorithm>

namespace bridge {

namespace {
// Anything above this is clamped to the maximum volume anyway
constexpr long long kAmountSaturation = 1000000;
}

QStringList Command::knownActions()
{
    return {action::Playback, action::Volume, action::Add, action::Clear,
            action::Load, action::Search, action::Info};
}

std::optional<Command> Command::decode(const QString& topicSuffix, const QByteArray& payload)
{
    if (!knownActions().contains(topicSuffix)) {
        return std::nullopt;
    }
    return Command{topicSuffix, QString::fromUtf8(payload)};
}

int VolumeAdjustment::apply(int current) const
{
    switch (op) {
    case Operator::Set:
        return player::clampVolume(amount);
    case Operator::Decrease:
        return player::clampVolume(static_cast<long long>(current) - amount);
    case Operator::Increase:
        return player::clampVolume(static_cast<long long>(current) + amount);
    }
    return player::clampVolume(current);
}

std::optional<VolumeAdjustment> VolumeAdjustment::parse(const QString& value, ParseError* error)
{
    auto fail = [error](ParseError reason) -> std::optional<VolumeAdjustment> {
        if (error) {
            *error = reason;
        }
        return std::nullopt;
    };

    if (value.size() < 2) {
        return fail(ParseError::TooShort);
    }

    // Digits only: no sign, no whitespace
    long long amount = 0;
    const QString digits = value.mid(1);
    for (const QChar c : digits) {
        if (c < QLatin1Char('0') || c > QLatin1Char('9')) {
            return fail(ParseError::InvalidAmount);
        }
        amount = std::min(amount * 10 + (c.unicode() - '0'), kAmountSaturation);
    }

    VolumeAdjustment adjustment;
    adjustment.amount = amount;
    switch (value.at(0).unicode()) {
    case '=':
        adjustment.op = Operator::Set;
        break;
    case '-':
        adjustment.op = Operator::Decrease;
        break;
    case '+':
        adjustment.op = Operator::Increase;
        break;
    default:
        return fail(ParseError::UnknownOperator);
    }
    return adjustment;
}

} // namespace bridge
