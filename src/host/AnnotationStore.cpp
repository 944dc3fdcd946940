#include "host/AnnotationStore.hpp"

#include "host/logging.hpp"

#include <utility>

namespace uuidstamp::host {

AnnotationStore::AnnotationStore(DisplaySettings settings, QObject* parent)
    : QObject(parent)
    , settings_(settings) {}

AnnotationStore::~AnnotationStore() = default;

void AnnotationStore::setSettings(const DisplaySettings& settings) {
    settings_ = settings;
}

void AnnotationStore::insert(const Annotation& annotation) {
    const auto existing = annotations_.constFind(annotation.offset);
    if (existing != annotations_.cend()) {
        if (existing.value() == annotation) return;
        annotations_.insert(annotation.offset, annotation);
        emit annotationUpdated(annotation);
        return;
    }
    annotations_.insert(annotation.offset, annotation);
    emit annotationAdded(annotation);
}

bool AnnotationStore::remove(qsizetype offset) {
    const auto it = annotations_.find(offset);
    if (it == annotations_.end()) return false;
    const auto removed = it.value();
    annotations_.erase(it);
    emit annotationRemoved(removed);
    return true;
}

void AnnotationStore::clear() {
    if (annotations_.isEmpty()) return;
    const auto old = std::exchange(annotations_, AnnotationMap{});
    for (const auto& a : old) {
        emit annotationRemoved(a);
    }
    emit cleared();
}

std::optional<Annotation> AnnotationStore::at(qsizetype offset) const {
    const auto it = annotations_.constFind(offset);
    if (it == annotations_.cend()) return std::nullopt;
    return it.value();
}

QList<Annotation> AnnotationStore::annotations() const {
    return annotations_.values();
}

QList<Annotation> AnnotationStore::annotationsIn(qsizetype start, qsizetype end) const {
    QList<Annotation> out;
    for (const auto& a : annotations_) {
        if (a.offset >= end) break;
        if (a.end() > start) {
            out.append(a);
        }
    }
    return out;
}

AnnotationDiff AnnotationStore::rescan(const QString& text, Instant now) {
    auto fresh = annotate_text(text, to_scan_options(settings_), now);
    auto diff = diff_annotations(annotations_, fresh);
    annotations_ = std::move(fresh);

    for (const auto& a : diff.removed) emit annotationRemoved(a);
    for (const auto& a : diff.updated) emit annotationUpdated(a);
    for (const auto& a : diff.added) emit annotationAdded(a);

    qCDebug(uuidstampScanLog) << "rescan:" << diff.added.size() << "added,"
                              << diff.updated.size() << "updated,"
                              << diff.removed.size() << "removed";
    return diff;
}

} // namespace uuidstamp::host
