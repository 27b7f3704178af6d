#include <QtTest/QtTest>

#include "app/pickercontroller.h"
#include "selection/selectionstate.h"
#include "fakelayerhost.h"
#include "testcatalog.h"

class PickerControllerTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void confirmAddsChosenTilesetOnce();
    void confirmWithoutSelectionDoesNothing();
    void failureKeepsBrowsing();
    void queryKeepsOrReplacesSelection();
    void hiddenServiceCannotBeSelected();
    void restoreSelectionFallsBackToFirst();
};

void PickerControllerTest::initTestCase()
{
    qRegisterMetaType<AddLayerResult>();
}

void PickerControllerTest::confirmAddsChosenTilesetOnce()
{
    FakeLayerHost host;
    HostIntegrationAdapter adapter(&host);
    PickerController controller(TestCatalog::catalog(), &adapter);
    QSignalSpy confirmedSpy(&controller, &PickerController::confirmed);

    controller.selectService(QStringLiteral("sjokart"));
    controller.selectTileset(QStringLiteral("WebMercator"));
    QVERIFY(controller.canConfirm());

    QVERIFY(controller.confirm());
    QCOMPARE(adapter.requestCount(), 1);
    QCOMPARE(host.layers.size(), 1);
    QCOMPARE(host.layers.first().second.title, QStringLiteral("Sjøkart [WMTS] (WebMercator)"));
    QCOMPARE(host.groups, QStringList{QStringLiteral("Bakgrunnskart")});
    QCOMPARE(controller.state(), PickerController::State::Confirmed);
    QCOMPARE(confirmedSpy.count(), 1);
    QVERIFY(controller.lastResult().ok);

    // Confirmed is terminal
    QVERIFY(!controller.confirm());
    controller.selectService(QStringLiteral("flybilder"));
    QCOMPARE(controller.selection()->serviceId(), QStringLiteral("sjokart"));
    QCOMPARE(adapter.requestCount(), 1);
}

void PickerControllerTest::confirmWithoutSelectionDoesNothing()
{
    FakeLayerHost host;
    HostIntegrationAdapter adapter(&host);
    PickerController controller(TestCatalog::catalog(), &adapter);

    QVERIFY(!controller.canConfirm());
    QVERIFY(!controller.confirm());
    QCOMPARE(adapter.requestCount(), 0);
    QCOMPARE(controller.state(), PickerController::State::Browsing);

    PickerController detached(TestCatalog::catalog(), nullptr);
    detached.selectService(QStringLiteral("sjokart"));
    QVERIFY(!detached.canConfirm());
}

void PickerControllerTest::failureKeepsBrowsing()
{
    FakeLayerHost host;
    host.failAdd = true;
    HostIntegrationAdapter adapter(&host);
    PickerController controller(TestCatalog::catalog(), &adapter);
    QSignalSpy failedSpy(&controller, &PickerController::addLayerFailed);

    controller.selectService(QStringLiteral("sjokart"));
    QVERIFY(!controller.confirm());
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.first().first().toString(), QStringLiteral("Laget er ugyldig"));
    QCOMPARE(controller.state(), PickerController::State::Browsing);
    QVERIFY(controller.canConfirm());

    // Retry after the host recovers
    host.failAdd = false;
    controller.selectTileset(QStringLiteral("WebMercator"));
    QVERIFY(controller.confirm());
    QCOMPARE(adapter.requestCount(), 2);
}

void PickerControllerTest::queryKeepsOrReplacesSelection()
{
    PickerController controller(TestCatalog::catalog(), nullptr);
    QSignalSpy filterSpy(&controller, &PickerController::filterChanged);

    controller.selectService(QStringLiteral("sjokart"));
    controller.selectTileset(QStringLiteral("WebMercator"));

    controller.setQuery(QStringLiteral("kart"));
    QCOMPARE(controller.visibleEntries().size(), 1);
    QCOMPARE(controller.selection()->tilesetLabel(), QStringLiteral("WebMercator"));

    controller.setQuery(QStringLiteral("fly"));
    QVERIFY(controller.isVisible(QStringLiteral("flybilder")));
    QVERIFY(!controller.isVisible(QStringLiteral("sjokart")));
    QCOMPARE(controller.selection()->serviceId(), QStringLiteral("flybilder"));

    controller.setQuery(QStringLiteral("ingenting"));
    QVERIFY(controller.visibleEntries().isEmpty());
    QVERIFY(!controller.selection()->hasSelection());

    controller.setQuery(QString());
    QCOMPARE(controller.visibleEntries().size(), 2);
    QCOMPARE(controller.selection()->serviceId(), QStringLiteral("flybilder"));
    QCOMPARE(filterSpy.count(), 4);
}

void PickerControllerTest::hiddenServiceCannotBeSelected()
{
    PickerController controller(TestCatalog::catalog(), nullptr);
    controller.setQuery(QStringLiteral("sjø"));
    QCOMPARE(controller.selection()->serviceId(), QStringLiteral("sjokart"));

    controller.selectService(QStringLiteral("flybilder"));
    QCOMPARE(controller.selection()->serviceId(), QStringLiteral("sjokart"));
}

void PickerControllerTest::restoreSelectionFallsBackToFirst()
{
    PickerController controller(TestCatalog::catalog(), nullptr);
    controller.restoreSelection(QStringLiteral("sjokart"), QStringLiteral("wms"), QStringLiteral("UTM33 WMS"));
    QCOMPARE(controller.selection()->offeringKey(), QStringLiteral("wms"));
    QCOMPARE(controller.selection()->tilesetLabel(), QStringLiteral("UTM33 WMS"));

    controller.restoreSelection(QStringLiteral("gone"), QString(), QString());
    QCOMPARE(controller.selection()->serviceId(), QStringLiteral("flybilder"));
    QCOMPARE(controller.selection()->tilesetLabel(), QStringLiteral("UTM32"));

    controller.restoreSelection(QStringLiteral("sjokart"), QStringLiteral("wmts"), QStringLiteral("UTM99"));
    QCOMPARE(controller.selection()->serviceId(), QStringLiteral("sjokart"));
    QCOMPARE(controller.selection()->tilesetLabel(), QStringLiteral("UTM33"));
}

QTEST_MAIN(PickerControllerTest)
#include "pickercontrollertest.moc"
