#pragma once

#include "host/annotation.hpp"
#include "host/settings.hpp"

#include <QObject>

#include <optional>

namespace uuidstamp::host {

/**
 * AnnotationStore - The set of annotations currently shown for one document.
 *
 * The store is the only owner of display state; the core scan stays
 * stateless. rescan() recomputes annotations for the whole text and only
 * emits signals for spans that actually changed.
 */
class AnnotationStore final : public QObject {
    Q_OBJECT

public:
    explicit AnnotationStore(DisplaySettings settings = {}, QObject* parent = nullptr);
    ~AnnotationStore() override;

    [[nodiscard]] const DisplaySettings& settings() const { return settings_; }
    void setSettings(const DisplaySettings& settings);

    void insert(const Annotation& annotation);
    bool remove(qsizetype offset);
    void clear();

    [[nodiscard]] std::optional<Annotation> at(qsizetype offset) const;
    [[nodiscard]] QList<Annotation> annotations() const;
    [[nodiscard]] qsizetype size() const { return annotations_.size(); }
    [[nodiscard]] bool isEmpty() const { return annotations_.isEmpty(); }

    // Annotations whose span intersects [start, end).
    [[nodiscard]] QList<Annotation> annotationsIn(qsizetype start, qsizetype end) const;

    AnnotationDiff rescan(const QString& text, Instant now = Instant::now());

signals:
    void annotationAdded(const uuidstamp::host::Annotation& annotation);
    void annotationUpdated(const uuidstamp::host::Annotation& annotation);
    void annotationRemoved(const uuidstamp::host::Annotation& annotation);
    void cleared();

private:
    DisplaySettings settings_;
    AnnotationMap annotations_;
};

} // namespace uuidstamp::host
