#include <catch2/catch_test_macros.hpp>

#include <QString>

#include "host/AnnotationStore.hpp"

using namespace uuidstamp;
using namespace uuidstamp::host;

namespace {

const auto kUuidA = QStringLiteral("d2719bc0-95d4-11ed-9999-325096b39f47");
const auto kUuidB = QStringLiteral("13814000-1dd2-11b2-8000-000000000000");
const Instant kNow{1673897681 + 2 * 86400};

struct SignalLog {
    QList<Annotation> added;
    QList<Annotation> updated;
    QList<Annotation> removed;
    int cleared = 0;

    void attach(AnnotationStore& store) {
        QObject::connect(&store, &AnnotationStore::annotationAdded, [this](const Annotation& a) { added.append(a); });
        QObject::connect(&store, &AnnotationStore::annotationUpdated, [this](const Annotation& a) { updated.append(a); });
        QObject::connect(&store, &AnnotationStore::annotationRemoved, [this](const Annotation& a) { removed.append(a); });
        QObject::connect(&store, &AnnotationStore::cleared, [this]() { ++cleared; });
    }
};

} // namespace

TEST_CASE("AnnotationStore: rescan annotates every uuid", "[integration][annotations]") {
    AnnotationStore store;
    SignalLog log;
    log.attach(store);

    const auto text = QStringLiteral("a=") + kUuidA + QStringLiteral("\nb=") + kUuidB;
    const auto diff = store.rescan(text, kNow);

    REQUIRE(diff.added.size() == 2);
    REQUIRE(diff.removed.isEmpty());
    REQUIRE(log.added.size() == 2);
    REQUIRE(store.size() == 2);

    const auto first = store.at(2);
    REQUIRE(first.has_value());
    REQUIRE(first->uuid == kUuidA);
    REQUIRE(first->instant == QStringLiteral("2023-01-16T19:34:41"));
    REQUIRE(first->relative == QStringLiteral("2 days ago"));
    REQUIRE(first->label() == QStringLiteral("2023-01-16T19:34:41 (2 days ago)"));
    REQUIRE(first->end() == 2 + 36);
}

TEST_CASE("AnnotationStore: rescan only reports changed spans", "[integration][annotations]") {
    AnnotationStore store;
    const auto text = kUuidA + QStringLiteral(" ") + kUuidB;
    (void)store.rescan(text, kNow);

    SignalLog log;
    log.attach(store);

    SECTION("unchanged text is a no-op") {
        const auto diff = store.rescan(text, kNow);
        REQUIRE(diff.isEmpty());
        REQUIRE(log.added.isEmpty());
        REQUIRE(log.removed.isEmpty());
    }

    SECTION("removing one uuid removes only its annotation") {
        const auto diff = store.rescan(kUuidA + QStringLiteral(" gone"), kNow);
        REQUIRE(diff.removed.size() == 1);
        REQUIRE(diff.removed.first().uuid == kUuidB);
        REQUIRE(diff.added.isEmpty());
        REQUIRE(log.removed.size() == 1);
        REQUIRE(store.size() == 1);
    }

    SECTION("time moving on updates the relative label in place") {
        const auto diff = store.rescan(text, kNow + std::chrono::hours(24));
        REQUIRE(diff.updated.size() == 2);
        REQUIRE(log.updated.size() == 2);
        REQUIRE(store.at(0)->relative == QStringLiteral("3 days ago"));
    }
}

TEST_CASE("AnnotationStore: offsets are QString indices", "[integration][annotations]") {
    AnnotationStore store;
    // Two non-ASCII characters take 4 UTF-8 bytes but 2 UTF-16 units.
    const auto text = QStringLiteral("éè ") + kUuidA;
    (void)store.rescan(text, kNow);

    REQUIRE(store.size() == 1);
    const auto a = store.annotations().first();
    REQUIRE(a.offset == 3);
    REQUIRE(text.mid(a.offset, a.uuid.size()) == kUuidA);
}

TEST_CASE("AnnotationStore: explicit insert, remove and clear", "[integration][annotations]") {
    AnnotationStore store;
    SignalLog log;
    log.attach(store);

    Annotation a;
    a.offset = 10;
    a.uuid = kUuidA;
    a.instant = QStringLiteral("2023-01-16T19:34:41");

    store.insert(a);
    store.insert(a);
    REQUIRE(log.added.size() == 1);
    REQUIRE(log.updated.isEmpty());

    a.relative = QStringLiteral("1 day ago");
    store.insert(a);
    REQUIRE(log.updated.size() == 1);

    REQUIRE_FALSE(store.remove(11));
    REQUIRE(store.remove(10));
    REQUIRE(log.removed.size() == 1);
    REQUIRE(store.isEmpty());

    store.insert(a);
    a.offset = 100;
    store.insert(a);
    store.clear();
    REQUIRE(store.isEmpty());
    REQUIRE(log.cleared == 1);
    REQUIRE(log.removed.size() == 3);

    store.clear();
    REQUIRE(log.cleared == 1);
}

TEST_CASE("AnnotationStore: annotationsIn returns intersecting spans", "[integration][annotations]") {
    AnnotationStore store;
    const auto text = kUuidA + QStringLiteral("\n\n") + kUuidB;
    (void)store.rescan(text, kNow);

    REQUIRE(store.annotationsIn(0, 1).size() == 1);
    REQUIRE(store.annotationsIn(36, 38).isEmpty());
    REQUIRE(store.annotationsIn(30, 40).size() == 2);
    REQUIRE(store.annotationsIn(0, text.size()).size() == 2);
}

TEST_CASE("AnnotationStore: time-ago setting controls the relative label", "[integration][annotations]") {
    DisplaySettings settings;
    settings.time_ago_enabled = false;
    AnnotationStore store(settings);

    (void)store.rescan(kUuidA, kNow);
    REQUIRE(store.at(0)->relative.isEmpty());
    REQUIRE(store.at(0)->label() == QStringLiteral("2023-01-16T19:34:41"));

    settings.time_ago_enabled = true;
    settings.utc_offset_minutes = 60;
    store.setSettings(settings);
    const auto diff = store.rescan(kUuidA, kNow);
    REQUIRE(diff.updated.size() == 1);
    REQUIRE(store.at(0)->instant == QStringLiteral("2023-01-16T20:34:41"));
}

TEST_CASE("diff_annotations: classifies added, removed and updated", "[integration][annotations]") {
    Annotation a{0, kUuidA, QStringLiteral("x"), QString{}};
    Annotation b{40, kUuidB, QStringLiteral("y"), QString{}};
    Annotation b2 = b;
    b2.relative = QStringLiteral("now");
    Annotation c{80, kUuidA, QStringLiteral("z"), QString{}};

    AnnotationMap previous{{a.offset, a}, {b.offset, b}};
    AnnotationMap current{{b2.offset, b2}, {c.offset, c}};

    const auto diff = diff_annotations(previous, current);
    REQUIRE(diff.removed == QList<Annotation>{a});
    REQUIRE(diff.updated == QList<Annotation>{b2});
    REQUIRE(diff.added == QList<Annotation>{c});
}
