#include "track_format.h"

#include <json/json.h>
#include <memory>
#include <sstream>

namespace player
{
namespace
{
    QString writeCompact(const Json::Value& root)
    {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        builder["emitUTF8"] = true;
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        std::ostringstream out;
        writer->write(root, &out);
        return QString::fromStdString(out.str());
    }

    Json::Value makeDescription(const QString& name, const QString& artist,
                                const QString& album, const QString& uri)
    {
        Json::Value obj(Json::objectValue);
        obj["name"] = name.toStdString();
        obj["artist"] = artist.toStdString();
        obj["album"] = album.toStdString();
        obj["uri"] = uri.toStdString();
        return obj;
    }
}

QString describeTrack(const TrackInfo& track)
{
    if (track.isEmpty()) {
        return QString();
    }
    QStringList artists;
    for (const QString& artist : track.artists) {
        QString trimmed = artist.trimmed();
        if (!trimmed.isEmpty()) {
            artists.append(trimmed);
        }
    }
    // Fall back to the uri so a display never shows a blank name
    QString name = track.name.trimmed().isEmpty() ? track.uri : track.name.trimmed();
    return writeCompact(makeDescription(name, artists.join(QStringLiteral(", ")),
                                        track.album.trimmed(), track.uri));
}

QString describeStream(const QString& title)
{
    QString raw = title.trimmed();
    if (raw.isEmpty()) {
        return QString();
    }
    QString artist;
    QString name = raw;
    const QString separator = QStringLiteral(" - ");
    int pos = raw.indexOf(separator);
    if (pos > 0) {
        artist = raw.left(pos).trimmed();
        name = raw.mid(pos + separator.size()).trimmed();
        if (name.isEmpty()) {
            name = raw;
            artist.clear();
        }
    }
    return writeCompact(makeDescription(name, artist, QString(), QString()));
}

} // namespace player
