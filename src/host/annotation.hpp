#pragma once

#include "core/scan.hpp"

#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>

namespace uuidstamp::host {

/**
 * Annotation - A decoded UUID as the host displays it.
 *
 * `offset` is a QString (UTF-16) index into the scanned text.
 */
struct Annotation {
    qsizetype offset = -1;
    QString uuid;
    QString instant;   // display instant (offset applied)
    QString relative;  // empty when time-ago display is off

    [[nodiscard]] qsizetype end() const { return offset + uuid.size(); }
    [[nodiscard]] QString label() const;

    bool operator==(const Annotation&) const = default;
};

using AnnotationMap = QMap<qsizetype, Annotation>;

struct AnnotationDiff {
    QList<Annotation> added;
    QList<Annotation> removed;
    QList<Annotation> updated;  // same offset, different content

    [[nodiscard]] bool isEmpty() const {
        return added.isEmpty() && removed.isEmpty() && updated.isEmpty();
    }
};

// Compares the previous set against a fresh one, both keyed by offset.
[[nodiscard]] AnnotationDiff diff_annotations(const AnnotationMap& previous,
                                              const AnnotationMap& current);

// Runs the core scan over `text` and converts successful entries into
// annotations keyed by UTF-16 offset. Failed candidates are logged and skipped.
[[nodiscard]] AnnotationMap annotate_text(const QString& text,
                                          const ScanOptions& options,
                                          Instant now);

// Converts one successful scan entry. `offset` is the UTF-16 position.
[[nodiscard]] Annotation to_annotation(const CandidateUuid& candidate,
                                       const DecodedTimestamp& decoded,
                                       qsizetype offset);

} // namespace uuidstamp::host

Q_DECLARE_METATYPE(uuidstamp::host::Annotation)
