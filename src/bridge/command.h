#pragma once

#include <QString>
#include <QByteArray>
#include <QStringList>
#include <optional>
#include <stdexcept>

namespace bridge {

// Three-letter action codes accepted on the command topics
namespace action {
    inline const QString Playback = QStringLiteral("plb");
    inline const QString Volume = QStringLiteral("vol");
    inline const QString Add = QStringLiteral("add");
    inline const QString Clear = QStringLiteral("clr");
    inline const QString Load = QStringLiteral("loa");
    inline const QString Search = QStringLiteral("src");
    inline const QString Info = QStringLiteral("inf");
}

// Three-letter codes used on the state topics
namespace topic {
    inline const QString PlaybackState = QStringLiteral("sta");
    inline const QString Track = QStringLiteral("trk");
    inline const QString Volume = QStringLiteral("vol");
}

struct Command {
    QString name;      // One of the action codes
    QString rawValue;  // UTF-8 decoded payload, untrimmed

    static QStringList knownActions();

    // Returns std::nullopt when topicSuffix is not a known action code
    static std::optional<Command> decode(const QString& topicSuffix, const QByteArray& payload);
};

/**
 * Raised by handlers for actions that are part of the command vocabulary but
 * have no behaviour yet. Caught at the dispatch boundary.
 */
class NotImplementedError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

/**
 * Parsed "vol" value: <operator><digits>.
 * Oversized amounts saturate instead of failing; the result is clamped later.
 */
struct VolumeAdjustment {
    enum class Operator { Set, Decrease, Increase };
    Operator op = Operator::Set;
    long long amount = 0;

    // Applies the adjustment to `current` and clamps to the valid volume range
    int apply(int current) const;

    enum class ParseError { TooShort, InvalidAmount, UnknownOperator };
    // Returns the adjustment, or the reason the value was rejected in `error`
    static std::optional<VolumeAdjustment> parse(const QString& value, ParseError* error = nullptr);
};

} // namespace bridge
