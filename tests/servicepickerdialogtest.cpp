#include <QtTest/QtTest>

#include "app/pickercontroller.h"
#include "app/servicepickerdialog.h"
#include "pluginsettings.h"
#include "selection/selectionstate.h"
#include "fakelayerhost.h"
#include "testcatalog.h"

#include <QApplication>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QRadioButton>
#include <QSettings>
#include <QTemporaryDir>
#include <QTimer>

class ServicePickerDialogTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void listsServicesAndSelectsFirst();
    void searchHidesNonMatchingServices();
    void radiosFollowSelection();
    void disabledOfferingShowsReason();
    void addButtonConfirmsAndAccepts();
    void failedAddKeepsDialogOpen();
    void descriptionLinksUsePalette();
    void restoresRememberedSelection();

private:
    static QPushButton* addButton(const ServicePickerDialog& dlg);
    static QList<QRadioButton*> liveRadios(const ServicePickerDialog& dlg);

    QTemporaryDir m_settingsDir;
};

void ServicePickerDialogTest::initTestCase()
{
    qRegisterMetaType<AddLayerResult>();
    QVERIFY(m_settingsDir.isValid());
    QCoreApplication::setOrganizationName(QStringLiteral("BakgrunnskartTest"));
    QCoreApplication::setApplicationName(QStringLiteral("servicepickerdialogtest"));
    QSettings::setDefaultFormat(QSettings::IniFormat);
    QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, m_settingsDir.path());
}

void ServicePickerDialogTest::init()
{
    QSettings s;
    s.clear();
}

QPushButton* ServicePickerDialogTest::addButton(const ServicePickerDialog& dlg)
{
    for (QPushButton* b : dlg.findChildren<QPushButton*>()) {
        if (b->text() == QStringLiteral("Legg til")) return b;
    }
    return nullptr;
}

QList<QRadioButton*> ServicePickerDialogTest::liveRadios(const ServicePickerDialog& dlg)
{
    // Replaced radios are hidden and deleted later
    QList<QRadioButton*> out;
    for (QRadioButton* rb : dlg.findChildren<QRadioButton*>()) {
        if (!rb->isHidden()) out << rb;
    }
    return out;
}

void ServicePickerDialogTest::listsServicesAndSelectsFirst()
{
    FakeLayerHost host;
    HostIntegrationAdapter adapter(&host);
    ServicePickerDialog dlg(TestCatalog::catalog(), &adapter);

    QListWidget* list = dlg.findChild<QListWidget*>();
    QVERIFY(list);
    QCOMPARE(list->count(), 2);
    QCOMPARE(list->item(1)->text(), QStringLiteral("Sjøkart"));
    QVERIFY(!list->item(0)->icon().isNull());

    QCOMPARE(dlg.controller()->selection()->serviceId(), QStringLiteral("flybilder"));
    QCOMPARE(list->currentItem(), list->item(0));
    QVERIFY(addButton(dlg));
    QVERIFY(addButton(dlg)->isEnabled());
}

void ServicePickerDialogTest::searchHidesNonMatchingServices()
{
    ServicePickerDialog dlg(TestCatalog::catalog(), nullptr);
    QLineEdit* search = dlg.findChild<QLineEdit*>();
    QListWidget* list = dlg.findChild<QListWidget*>();
    QVERIFY(search && list);

    search->setText(QStringLiteral("sjø"));
    QVERIFY(list->item(0)->isHidden());
    QVERIFY(!list->item(1)->isHidden());
    QCOMPARE(dlg.controller()->selection()->serviceId(), QStringLiteral("sjokart"));

    search->clear();
    QVERIFY(!list->item(0)->isHidden());
    QCOMPARE(dlg.controller()->selection()->serviceId(), QStringLiteral("sjokart"));
}

void ServicePickerDialogTest::radiosFollowSelection()
{
    ServicePickerDialog dlg(TestCatalog::catalog(), nullptr);
    QListWidget* list = dlg.findChild<QListWidget*>();
    list->setCurrentRow(1);
    QCOMPARE(dlg.controller()->selection()->serviceId(), QStringLiteral("sjokart"));

    QRadioButton* mercator = nullptr;
    for (QRadioButton* rb : liveRadios(dlg)) {
        if (rb->text() == QStringLiteral("WebMercator")) mercator = rb;
    }
    QVERIFY(mercator);
    mercator->click();
    QCOMPARE(dlg.controller()->selection()->tilesetLabel(), QStringLiteral("WebMercator"));
    QVERIFY(mercator->isChecked());

    dlg.controller()->selectOffering(QStringLiteral("wms"));
    QStringList labels;
    for (QRadioButton* rb : liveRadios(dlg)) {
        if (rb->isChecked()) labels << rb->text();
    }
    QVERIFY(labels.contains(QStringLiteral("WMS")));
    QVERIFY(labels.contains(QStringLiteral("UTM33 WMS")));
}

void ServicePickerDialogTest::disabledOfferingShowsReason()
{
    ServicePickerDialog dlg(TestCatalog::catalog(), nullptr);
    dlg.controller()->selectService(QStringLiteral("sjokart"));

    QRadioButton* vt = nullptr;
    for (QRadioButton* rb : liveRadios(dlg)) {
        if (rb->text() == QStringLiteral("Vector tiles")) vt = rb;
    }
    QVERIFY(vt);
    QVERIFY(!vt->isEnabled());
    QCOMPARE(vt->toolTip(), QStringLiteral("Kommer senere"));
}

void ServicePickerDialogTest::addButtonConfirmsAndAccepts()
{
    FakeLayerHost host;
    HostIntegrationAdapter adapter(&host);
    ServicePickerDialog dlg(TestCatalog::catalog(), &adapter);

    dlg.controller()->selectService(QStringLiteral("sjokart"));
    dlg.controller()->selectTileset(QStringLiteral("WebMercator"));

    QPushButton* add = addButton(dlg);
    QVERIFY(add);
    add->click();

    QCOMPARE(host.layers.size(), 1);
    QCOMPARE(host.layers.first().second.title, QStringLiteral("Sjøkart [WMTS] (WebMercator)"));
    QCOMPARE(dlg.outcome(), DialogResult::Accepted);
    QVERIFY(!add->isEnabled());

    QCOMPARE(PluginSettings::lastServiceId(), QStringLiteral("sjokart"));
    QCOMPARE(PluginSettings::lastOfferingKey(), QStringLiteral("wmts"));
    QCOMPARE(PluginSettings::lastTilesetLabel(), QStringLiteral("WebMercator"));
}

void ServicePickerDialogTest::failedAddKeepsDialogOpen()
{
    FakeLayerHost host;
    host.failAdd = true;
    HostIntegrationAdapter adapter(&host);
    ServicePickerDialog dlg(TestCatalog::catalog(), &adapter);
    dlg.controller()->selectService(QStringLiteral("sjokart"));

    // The error notice is modal; dismiss it from inside its event loop
    QString notice;
    QTimer::singleShot(0, [&notice]() {
        for (QWidget* w : QApplication::topLevelWidgets()) {
            QMessageBox* box = qobject_cast<QMessageBox*>(w);
            if (box && box->isVisible() && box->button(QMessageBox::Ok)) {
                notice = box->text();
                box->button(QMessageBox::Ok)->click();
            }
        }
    });

    QPushButton* add = addButton(dlg);
    QVERIFY(add);
    add->click();

    QVERIFY(notice.contains(QStringLiteral("Laget er ugyldig")));
    QCOMPARE(dlg.outcome(), DialogResult::Rejected);
    QVERIFY(add->isEnabled());
    QVERIFY(host.layers.isEmpty());
    QVERIFY(PluginSettings::lastServiceId().isEmpty());

    // Retrying after the host recovers goes through
    host.failAdd = false;
    add->click();
    QCOMPARE(host.layers.size(), 1);
    QCOMPARE(dlg.outcome(), DialogResult::Accepted);
}

void ServicePickerDialogTest::descriptionLinksUsePalette()
{
    ServicePickerDialog dlg(TestCatalog::catalog(), nullptr);
    dlg.controller()->selectService(QStringLiteral("sjokart"));

    QLabel* description = nullptr;
    for (QLabel* l : dlg.findChildren<QLabel*>()) {
        if (l->text().contains(QStringLiteral("Rasterkart"))) description = l;
    }
    QVERIFY(description);

    // Markup is shown as written, the link color lives in the palette
    QCOMPARE(description->text(), TestCatalog::sjokart().description);
    const bool dark = DialogCompat::isDarkPalette(dlg.palette());
    QCOMPARE(description->palette().color(QPalette::Link), QColor(dark ? "#4ea3ff" : "#0b57d0"));
}

void ServicePickerDialogTest::restoresRememberedSelection()
{
    PluginSettings::rememberSelection(QStringLiteral("sjokart"), QStringLiteral("wms"), QStringLiteral("UTM33 WMS"));

    ServicePickerDialog dlg(TestCatalog::catalog(), nullptr);
    QCOMPARE(dlg.controller()->selection()->serviceId(), QStringLiteral("sjokart"));
    QCOMPARE(dlg.controller()->selection()->tilesetLabel(), QStringLiteral("UTM33 WMS"));
    QCOMPARE(dlg.findChild<QListWidget*>()->currentRow(), 1);
}

QTEST_MAIN(ServicePickerDialogTest)
#include "servicepickerdialogtest.moc"
