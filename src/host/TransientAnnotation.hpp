#pragma once

#include "host/annotation.hpp"
#include "host/settings.hpp"

#include <QObject>

#include <memory>
#include <optional>

class QTimer;

namespace uuidstamp::host {

/**
 * TransientAnnotation - Shows one annotation for a bounded time.
 *
 * A new show() supersedes the current annotation and restarts the timer.
 * When the timer fires the annotation is dropped and expired() is emitted.
 */
class TransientAnnotation final : public QObject {
    Q_OBJECT

public:
    explicit TransientAnnotation(DisplaySettings settings = {}, QObject* parent = nullptr);
    ~TransientAnnotation() override;

    void show(const Annotation& annotation);

    // Decodes the UUID under `position` in `text` and shows it. Returns
    // false (and shows nothing) when there is no decodable UUID there.
    bool showAt(const QString& text, qsizetype position, Instant now = Instant::now());

    void dismiss();

    [[nodiscard]] bool isActive() const;
    [[nodiscard]] const std::optional<Annotation>& current() const { return current_; }
    [[nodiscard]] int durationMs() const;

signals:
    void shown(const uuidstamp::host::Annotation& annotation);
    void expired(const uuidstamp::host::Annotation& annotation);
    void dismissed();

private slots:
    void onTimeout();

private:
    DisplaySettings settings_;
    std::unique_ptr<QTimer> timer_;
    std::optional<Annotation> current_;
};

} // namespace uuidstamp::host
