#include "host/TransientAnnotation.hpp"

#include "host/logging.hpp"
#include "core/uuid_matcher.hpp"

#include <QByteArray>
#include <QTimer>

namespace uuidstamp::host {

TransientAnnotation::TransientAnnotation(DisplaySettings settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , timer_(std::make_unique<QTimer>(this)) {
    timer_->setSingleShot(true);
    connect(timer_.get(), &QTimer::timeout, this, &TransientAnnotation::onTimeout);
}

TransientAnnotation::~TransientAnnotation() = default;

int TransientAnnotation::durationMs() const {
    return normalize_transient_ms(settings_.transient_ms);
}

void TransientAnnotation::show(const Annotation& annotation) {
    current_ = annotation;
    timer_->start(durationMs());
    emit shown(annotation);
}

bool TransientAnnotation::showAt(const QString& text, qsizetype position, Instant now) {
    if (position < 0 || position > text.size()) return false;

    // The core works on UTF-8 bytes; translate the cursor position.
    const auto prefix = QStringView(text).left(position).toUtf8();
    const auto utf8 = text.toUtf8();
    const auto view = std::string_view(utf8.constData(), static_cast<size_t>(utf8.size()));

    const auto candidate = match_at(view, static_cast<size_t>(prefix.size()));
    if (!candidate) return false;

    const auto decoded = decode_timestamp(candidate->text, to_scan_options(settings_), now);
    if (decoded.is_err()) {
        qCWarning(uuidstampScanLog) << "cannot show" << QString::fromStdString(candidate->text)
                                    << ":" << decoded.unwrap_err().message.c_str();
        return false;
    }

    const auto offset = QString::fromUtf8(utf8.constData(), static_cast<qsizetype>(candidate->offset)).size();
    show(to_annotation(*candidate, decoded.unwrap(), offset));
    return true;
}

void TransientAnnotation::dismiss() {
    timer_->stop();
    if (!current_) return;
    current_.reset();
    emit dismissed();
}

bool TransientAnnotation::isActive() const {
    return current_.has_value() && timer_->isActive();
}

void TransientAnnotation::onTimeout() {
    if (!current_) return;
    const auto expiredAnnotation = *current_;
    current_.reset();
    emit expired(expiredAnnotation);
}

} // namespace uuidstamp::host
