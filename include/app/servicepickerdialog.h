#ifndef SERVICEPICKERDIALOG_H
#define SERVICEPICKERDIALOG_H

#include "app/dialogcompat.h"
#include "catalog/catalog.h"
#include "host/hostintegration.h"
#include "preview/previewrenderer.h"

#include <QDialog>
#include <QSize>

class QAbstractButton;
class QBoxLayout;
class QButtonGroup;
class QDialogButtonBox;
class QGroupBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QPushButton;
class PickerController;

/**
 * @brief ServicePickerDialog - Browse, preview and add a basemap
 *
 * Left: search field and service list with thumbnails.
 * Right: preview banner, name, description, service type and tileset radios.
 * "Legg til" adds the layer through the host adapter and closes the dialog on
 * success; on failure a notice is shown and the dialog stays open.
 */
class ServicePickerDialog : public QDialog
{
    Q_OBJECT
public:
    ServicePickerDialog(const Catalog& catalog, HostIntegrationAdapter* adapter, QWidget* parent = nullptr);

    PickerController* controller() const { return m_controller; }
    DialogResult outcome() const { return DialogCompat::fromNative(result()); }

private slots:
    void onCurrentItemChanged(QListWidgetItem* current, QListWidgetItem* previous);
    void onFilterChanged();
    void onServiceChanged();
    void onOfferingChanged();
    void onTilesetChanged();
    void onTypeClicked(QAbstractButton* button);
    void onVariantClicked(QAbstractButton* button);
    void onAddClicked();
    void onConfirmed(const AddLayerResult& result);
    void onAddLayerFailed(const QString& message);

private:
    void populateList();
    void populateTypes();
    void populateVariants();
    void clearRadios(QButtonGroup* group, QBoxLayout* layout);
    void clearDetails();
    void applyDescriptionColors();
    void updateButtons();

    Catalog m_catalog;
    PickerController* m_controller{nullptr};
    PreviewRenderer m_renderer;
    QSize m_previewSize;
    int m_iconSize{50};

    QLineEdit* m_search{nullptr};
    QListWidget* m_list{nullptr};
    QLabel* m_preview{nullptr};
    QLabel* m_title{nullptr};
    QLabel* m_description{nullptr};
    QGroupBox* m_typesBox{nullptr};
    QBoxLayout* m_typesLayout{nullptr};
    QButtonGroup* m_typeGroup{nullptr};
    QGroupBox* m_variantsBox{nullptr};
    QBoxLayout* m_variantsLayout{nullptr};
    QButtonGroup* m_variantGroup{nullptr};
    QDialogButtonBox* m_buttons{nullptr};
    QPushButton* m_addBtn{nullptr};
    bool m_blockUpdates{false};
};

#endif // SERVICEPICKERDIALOG_H
