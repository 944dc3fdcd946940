#include "host/annotation.hpp"

#include "host/logging.hpp"

#include <QByteArray>

namespace uuidstamp::host {
namespace {

// Tracks UTF-8 byte offsets -> UTF-16 indices while walking forward.
class OffsetMapper {
public:
    explicit OffsetMapper(const QByteArray& utf8) : utf8_(utf8) {}

    qsizetype toUtf16(qsizetype byteOffset) {
        if (byteOffset < lastByte_) {
            lastByte_ = 0;
            lastChar_ = 0;
        }
        lastChar_ += QString::fromUtf8(utf8_.constData() + lastByte_, byteOffset - lastByte_).size();
        lastByte_ = byteOffset;
        return lastChar_;
    }

private:
    const QByteArray& utf8_;
    qsizetype lastByte_ = 0;
    qsizetype lastChar_ = 0;
};

} // namespace

QString Annotation::label() const {
    if (relative.isEmpty()) {
        return instant;
    }
    return QStringLiteral("%1 (%2)").arg(instant, relative);
}

AnnotationDiff diff_annotations(const AnnotationMap& previous, const AnnotationMap& current) {
    AnnotationDiff diff;
    for (auto it = previous.cbegin(); it != previous.cend(); ++it) {
        const auto found = current.constFind(it.key());
        if (found == current.cend()) {
            diff.removed.append(it.value());
        } else if (!(found.value() == it.value())) {
            diff.updated.append(found.value());
        }
    }
    for (auto it = current.cbegin(); it != current.cend(); ++it) {
        if (!previous.contains(it.key())) {
            diff.added.append(it.value());
        }
    }
    return diff;
}

Annotation to_annotation(const CandidateUuid& candidate,
                         const DecodedTimestamp& decoded,
                         qsizetype offset) {
    Annotation a;
    a.offset = offset;
    a.uuid = QString::fromStdString(candidate.text);
    a.instant = QString::fromStdString(decoded.display_instant);
    if (decoded.relative) {
        a.relative = QString::fromStdString(*decoded.relative);
    }
    return a;
}

AnnotationMap annotate_text(const QString& text, const ScanOptions& options, Instant now) {
    const auto utf8 = text.toUtf8();
    OffsetMapper mapper(utf8);

    AnnotationMap out;
    const auto entries = scan_text(std::string_view(utf8.constData(), static_cast<size_t>(utf8.size())),
                                   options, now);
    for (const auto& entry : entries) {
        const auto offset = mapper.toUtf16(static_cast<qsizetype>(entry.candidate.offset));
        if (entry.decoded.is_err()) {
            qCWarning(uuidstampScanLog) << "skipping" << QString::fromStdString(entry.candidate.text)
                                        << "at" << offset << ":"
                                        << entry.decoded.unwrap_err().message.c_str();
            continue;
        }
        out.insert(offset, to_annotation(entry.candidate, entry.decoded.unwrap(), offset));
    }
    qCDebug(uuidstampScanLog) << "annotated" << out.size() << "of" << entries.size() << "candidates";
    return out;
}

} // namespace uuidstamp::host
