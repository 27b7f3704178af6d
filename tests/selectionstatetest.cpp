#include <QtTest/QtTest>

#include "selection/selectionstate.h"
#include "testcatalog.h"

class SelectionStateTest : public QObject {
    Q_OBJECT

private slots:
    void startsEmpty();
    void selectServicePicksFirstTileset();
    void switchingServiceResetsTileset();
    void foreignTilesetLabelIsIgnored();
    void selectOfferingPicksItsFirstTileset();
    void disabledOfferingIsIgnored();
    void unknownServiceClearsSelection();
    void signalsOnlyOnChange();
};

void SelectionStateTest::startsEmpty()
{
    SelectionState state(TestCatalog::catalog());
    QVERIFY(!state.hasSelection());
    QVERIFY(!state.currentService());
    QVERIFY(!state.current().isValid());
}

void SelectionStateTest::selectServicePicksFirstTileset()
{
    SelectionState state(TestCatalog::catalog());
    QVERIFY(state.selectService(QStringLiteral("sjokart")));
    QCOMPARE(state.serviceId(), QStringLiteral("sjokart"));
    QCOMPARE(state.offeringKey(), QStringLiteral("wmts"));
    QCOMPARE(state.tilesetLabel(), QStringLiteral("UTM33"));

    const Selection sel = state.current();
    QVERIFY(sel.isValid());
    QCOMPARE(sel.service.name, QStringLiteral("Sjøkart"));
    QCOMPARE(sel.variant.crs, QStringLiteral("EPSG:25833"));
}

void SelectionStateTest::switchingServiceResetsTileset()
{
    SelectionState state(TestCatalog::catalog());
    state.selectService(QStringLiteral("sjokart"));
    QVERIFY(state.selectTileset(QStringLiteral("WebMercator")));
    QCOMPARE(state.tilesetLabel(), QStringLiteral("WebMercator"));

    state.selectService(QStringLiteral("flybilder"));
    QCOMPARE(state.tilesetLabel(), QStringLiteral("UTM32"));
    QCOMPARE(state.currentTileset()->crs, QStringLiteral("EPSG:25832"));
}

void SelectionStateTest::foreignTilesetLabelIsIgnored()
{
    SelectionState state(TestCatalog::catalog());
    state.selectService(QStringLiteral("sjokart"));

    QSignalSpy spy(&state, &SelectionState::selectionChanged);
    QVERIFY(!state.selectTileset(QStringLiteral("UTM32")));
    QVERIFY(!state.selectTileset(QStringLiteral("UTM33 WMS")));
    QCOMPARE(state.tilesetLabel(), QStringLiteral("UTM33"));
    QCOMPARE(spy.count(), 0);
}

void SelectionStateTest::selectOfferingPicksItsFirstTileset()
{
    SelectionState state(TestCatalog::catalog());
    state.selectService(QStringLiteral("sjokart"));
    state.selectTileset(QStringLiteral("WebMercator"));

    QVERIFY(state.selectOffering(QStringLiteral("wms")));
    QCOMPARE(state.offeringKey(), QStringLiteral("wms"));
    QCOMPARE(state.tilesetLabel(), QStringLiteral("UTM33 WMS"));
    QCOMPARE(state.currentTileset()->kind, LayerKind::Wms);
}

void SelectionStateTest::disabledOfferingIsIgnored()
{
    SelectionState state(TestCatalog::catalog());
    state.selectService(QStringLiteral("sjokart"));
    QVERIFY(!state.selectOffering(QStringLiteral("vectortile")));
    QVERIFY(!state.selectOffering(QStringLiteral("nope")));
    QCOMPARE(state.offeringKey(), QStringLiteral("wmts"));
    QVERIFY(state.hasSelection());
}

void SelectionStateTest::unknownServiceClearsSelection()
{
    SelectionState state(TestCatalog::catalog());
    state.selectService(QStringLiteral("sjokart"));
    QVERIFY(!state.selectService(QStringLiteral("gone")));
    QVERIFY(state.serviceId().isEmpty());
    QVERIFY(!state.hasSelection());
}

void SelectionStateTest::signalsOnlyOnChange()
{
    SelectionState state(TestCatalog::catalog());
    QSignalSpy serviceSpy(&state, &SelectionState::serviceChanged);
    QSignalSpy tilesetSpy(&state, &SelectionState::tilesetChanged);

    state.selectService(QStringLiteral("sjokart"));
    state.selectService(QStringLiteral("sjokart"));
    QCOMPARE(serviceSpy.count(), 1);
    QCOMPARE(tilesetSpy.count(), 1);

    state.selectTileset(QStringLiteral("WebMercator"));
    QCOMPARE(serviceSpy.count(), 1);
    QCOMPARE(tilesetSpy.count(), 2);
    QCOMPARE(tilesetSpy.last().first().toString(), QStringLiteral("WebMercator"));
}

QTEST_MAIN(SelectionStateTest)
#include "selectionstatetest.moc"
