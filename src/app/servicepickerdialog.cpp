#include "app/servicepickerdialog.h"
#include "app/pickercontroller.h"
#include "gdal/crsinfo.h"
#include "pluginsettings.h"
#include "selection/selectionstate.h"

#include <QButtonGroup>
#include <QDialogButtonBox>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QIcon>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QListWidgetItem>
#include <QMessageBox>
#include <QPalette>
#include <QPushButton>
#include <QRadioButton>
#include <QSplitter>
#include <QVBoxLayout>

namespace {
const char* kOfferingKeyProperty = "offeringKey";
const char* kTilesetLabelProperty = "tilesetLabel";
}

ServicePickerDialog::ServicePickerDialog(const Catalog& catalog, HostIntegrationAdapter* adapter, QWidget* parent)
    : QDialog(parent), m_catalog(catalog)
{
    setWindowTitle(tr("Bakgrunnskart"));
    setMinimumSize(900, 580);

    m_renderer.setAnchor(PreviewRenderer::anchorFromString(PluginSettings::previewCropAnchor()));
    m_previewSize = PluginSettings::previewSize();
    m_iconSize = PluginSettings::listIconSize();

    m_controller = new PickerController(m_catalog, adapter, this);

    auto* root = new QVBoxLayout(this);

    auto* header = new QLabel(tr("Velg et bakgrunnskart:"), this);
    header->setWordWrap(true);
    root->addWidget(header);

    auto* splitter = new QSplitter(Qt::Horizontal, this);
    root->addWidget(splitter, 1);

    // Left: search + list
    auto* left = new QWidget(splitter);
    auto* leftLayout = new QVBoxLayout(left);
    leftLayout->setContentsMargins(0, 0, 0, 0);

    m_search = new QLineEdit(left);
    m_search->setPlaceholderText(tr("Søk…"));
    m_search->setClearButtonEnabled(true);
    leftLayout->addWidget(m_search);

    m_list = new QListWidget(left);
    m_list->setIconSize(QSize(m_iconSize, m_iconSize));
    m_list->setSelectionMode(QAbstractItemView::SingleSelection);
    leftLayout->addWidget(m_list, 1);
    splitter->addWidget(left);

    // Right: preview + details + radios
    auto* right = new QWidget(splitter);
    auto* rightLayout = new QVBoxLayout(right);
    rightLayout->setContentsMargins(0, 0, 0, 0);

    m_preview = new QLabel(right);
    m_preview->setAlignment(Qt::AlignCenter);
    m_preview->setMinimumHeight(m_previewSize.height());
    m_preview->setStyleSheet("QLabel { border: 1px solid rgba(255,255,255,0.15); }");
    rightLayout->addWidget(m_preview);

    m_title = new QLabel(right);
    m_title->setWordWrap(true);
    m_title->setTextFormat(Qt::RichText);
    rightLayout->addWidget(m_title);

    m_description = new QLabel(right);
    m_description->setWordWrap(true);
    m_description->setTextFormat(Qt::RichText);
    m_description->setTextInteractionFlags(Qt::TextBrowserInteraction);
    m_description->setOpenExternalLinks(true);
    rightLayout->addWidget(m_description);

    applyDescriptionColors();

    m_typesBox = new QGroupBox(tr("Velg tjenestetype"), right);
    m_typesLayout = new QHBoxLayout(m_typesBox);
    rightLayout->addWidget(m_typesBox);
    m_typeGroup = new QButtonGroup(this);
    m_typeGroup->setExclusive(true);

    m_variantsBox = new QGroupBox(tr("Velg tileset / projeksjon"), right);
    m_variantsLayout = new QVBoxLayout(m_variantsBox);
    rightLayout->addWidget(m_variantsBox);
    m_variantGroup = new QButtonGroup(this);
    m_variantGroup->setExclusive(true);

    rightLayout->addStretch(1);
    splitter->addWidget(right);
    splitter->setStretchFactor(1, 1);

    // Buttons
    m_buttons = new QDialogButtonBox(this);
    m_addBtn = m_buttons->addButton(tr("Legg til"), DialogCompat::toNative(ButtonRole::Accept));
    m_addBtn->setDefault(true);
    m_buttons->addButton(tr("Avbryt"), DialogCompat::toNative(ButtonRole::Reject));
    root->addWidget(m_buttons);

    connect(m_addBtn, &QPushButton::clicked, this, &ServicePickerDialog::onAddClicked);
    connect(m_buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);

    connect(m_search, &QLineEdit::textChanged, m_controller, &PickerController::setQuery);
    connect(m_list, &QListWidget::currentItemChanged, this, &ServicePickerDialog::onCurrentItemChanged);
    connect(m_typeGroup, QOverload<QAbstractButton*>::of(&QButtonGroup::buttonClicked),
            this, &ServicePickerDialog::onTypeClicked);
    connect(m_variantGroup, QOverload<QAbstractButton*>::of(&QButtonGroup::buttonClicked),
            this, &ServicePickerDialog::onVariantClicked);

    SelectionState* sel = m_controller->selection();
    connect(sel, &SelectionState::serviceChanged, this, &ServicePickerDialog::onServiceChanged);
    connect(sel, &SelectionState::offeringChanged, this, &ServicePickerDialog::onOfferingChanged);
    connect(sel, &SelectionState::tilesetChanged, this, &ServicePickerDialog::onTilesetChanged);
    connect(sel, &SelectionState::selectionChanged, this, &ServicePickerDialog::updateButtons);

    connect(m_controller, &PickerController::filterChanged, this, &ServicePickerDialog::onFilterChanged);
    connect(m_controller, &PickerController::confirmed, this, &ServicePickerDialog::onConfirmed);
    connect(m_controller, &PickerController::addLayerFailed, this, &ServicePickerDialog::onAddLayerFailed);

    populateList();
    m_controller->restoreSelection(PluginSettings::lastServiceId(),
                                   PluginSettings::lastOfferingKey(),
                                   PluginSettings::lastTilesetLabel());
    if (!sel->currentService()) clearDetails();
    updateButtons();
}

void ServicePickerDialog::applyDescriptionColors()
{
    const bool dark = DialogCompat::isDarkPalette(palette());
    const QString text = dark ? "#ffffff" : "#222222";

    m_title->setStyleSheet(QString("QLabel { color: %1; font-size: 13px; }").arg(text));

    // Rich text anchors take their color from QPalette::Link
    QPalette pal = m_description->palette();
    pal.setColor(QPalette::WindowText, QColor(text));
    pal.setColor(QPalette::Text, QColor(text));
    pal.setColor(QPalette::Link, QColor(dark ? "#4ea3ff" : "#0b57d0"));
    m_description->setPalette(pal);
}

void ServicePickerDialog::populateList()
{
    m_blockUpdates = true;
    m_list->clear();
    const qreal dpr = DialogCompat::devicePixelRatio(this);
    for (const ServiceEntry& entry : m_catalog.entries()) {
        auto* item = new QListWidgetItem(entry.name, m_list);
        item->setData(Qt::UserRole, entry.id);
        item->setIcon(QIcon(m_renderer.thumbnail(entry.thumbnailRef(), m_iconSize, dpr)));
    }
    m_blockUpdates = false;
}

void ServicePickerDialog::clearRadios(QButtonGroup* group, QBoxLayout* layout)
{
    const auto buttons = group->buttons();
    for (QAbstractButton* b : buttons) {
        group->removeButton(b);
    }
    while (QLayoutItem* it = layout->takeAt(0)) {
        if (QWidget* w = it->widget()) {
            w->hide();
            w->deleteLater();
        }
        delete it;
    }
}

void ServicePickerDialog::clearDetails()
{
    m_preview->clear();
    m_title->clear();
    m_description->clear();
    clearRadios(m_typeGroup, m_typesLayout);
    clearRadios(m_variantGroup, m_variantsLayout);
}

void ServicePickerDialog::populateTypes()
{
    clearRadios(m_typeGroup, m_typesLayout);
    const ServiceEntry* svc = m_controller->selection()->currentService();
    if (!svc) return;

    const QString currentKey = m_controller->selection()->offeringKey();
    for (const ServiceOffering& off : svc->offerings) {
        auto* rb = new QRadioButton(off.label, m_typesBox);
        rb->setProperty(kOfferingKeyProperty, off.key);
        if (!off.isSelectable()) {
            rb->setEnabled(false);
            rb->setToolTip(off.disabledReason.isEmpty() ? tr("Ikke tilgjengelig") : off.disabledReason);
        }
        rb->setChecked(off.key == currentKey);
        m_typeGroup->addButton(rb);
        m_typesLayout->addWidget(rb);
    }
    m_typesLayout->addStretch(1);
}

void ServicePickerDialog::populateVariants()
{
    clearRadios(m_variantGroup, m_variantsLayout);
    const ServiceOffering* off = m_controller->selection()->currentOffering();
    if (!off) return;

    const QString currentLabel = m_controller->selection()->tilesetLabel();
    for (const TilesetVariant& v : off->variants) {
        auto* rb = new QRadioButton(v.label, m_variantsBox);
        rb->setProperty(kTilesetLabelProperty, v.label);
        rb->setToolTip(CrsInfo::tooltip(v.crs));
        rb->setChecked(v.label == currentLabel);
        m_variantGroup->addButton(rb);
        m_variantsLayout->addWidget(rb);
    }
    m_variantsLayout->addStretch(1);
}

void ServicePickerDialog::onCurrentItemChanged(QListWidgetItem* current, QListWidgetItem* previous)
{
    Q_UNUSED(previous);
    if (m_blockUpdates || !current || current->isHidden()) return;
    m_controller->selectService(current->data(Qt::UserRole).toString());
}

void ServicePickerDialog::onFilterChanged()
{
    m_blockUpdates = true;
    for (int i = 0; i < m_list->count(); ++i) {
        QListWidgetItem* it = m_list->item(i);
        it->setHidden(!m_controller->isVisible(it->data(Qt::UserRole).toString()));
    }
    m_blockUpdates = false;

    if (!m_controller->selection()->currentService()) clearDetails();
}

void ServicePickerDialog::onServiceChanged()
{
    const ServiceEntry* svc = m_controller->selection()->currentService();
    if (!svc) {
        clearDetails();
        m_blockUpdates = true;
        m_list->setCurrentItem(nullptr);
        m_blockUpdates = false;
        return;
    }

    // Keep the list highlight in step when the selection moved on its own
    m_blockUpdates = true;
    for (int i = 0; i < m_list->count(); ++i) {
        QListWidgetItem* it = m_list->item(i);
        if (it->data(Qt::UserRole).toString() == svc->id) {
            m_list->setCurrentItem(it);
            break;
        }
    }
    m_blockUpdates = false;

    m_preview->setPixmap(m_renderer.render(svc->preview, m_previewSize.width(), m_previewSize.height(),
                                           DialogCompat::devicePixelRatio(this)));
    m_title->setText(QString("<b>%1</b>").arg(svc->name.toHtmlEscaped()));

    m_description->setText(svc->description);

    populateTypes();
    populateVariants();
}

void ServicePickerDialog::onOfferingChanged()
{
    const QString key = m_controller->selection()->offeringKey();
    for (QAbstractButton* b : m_typeGroup->buttons()) {
        if (b->property(kOfferingKeyProperty).toString() == key) {
            b->setChecked(true);
            break;
        }
    }
    populateVariants();
}

void ServicePickerDialog::onTilesetChanged()
{
    const QString label = m_controller->selection()->tilesetLabel();
    for (QAbstractButton* b : m_variantGroup->buttons()) {
        if (b->property(kTilesetLabelProperty).toString() == label) {
            b->setChecked(true);
            break;
        }
    }
}

void ServicePickerDialog::onTypeClicked(QAbstractButton* button)
{
    if (!button) return;
    m_controller->selectOffering(button->property(kOfferingKeyProperty).toString());
}

void ServicePickerDialog::onVariantClicked(QAbstractButton* button)
{
    if (!button) return;
    m_controller->selectTileset(button->property(kTilesetLabelProperty).toString());
}

void ServicePickerDialog::updateButtons()
{
    m_addBtn->setEnabled(m_controller->canConfirm());
}

void ServicePickerDialog::onAddClicked()
{
    if (!m_controller->canConfirm()) return;
    m_addBtn->setEnabled(false);
    m_controller->confirm();
    updateButtons();
}

void ServicePickerDialog::onConfirmed(const AddLayerResult& result)
{
    Q_UNUSED(result);
    const SelectionState* sel = m_controller->selection();
    PluginSettings::rememberSelection(sel->serviceId(), sel->offeringKey(), sel->tilesetLabel());
    done(DialogCompat::toNative(DialogResult::Accepted));
}

void ServicePickerDialog::onAddLayerFailed(const QString& message)
{
    QMessageBox::critical(this, tr("Bakgrunnskart"), message);
}
