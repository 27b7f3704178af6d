#ifndef DIALOGCOMPAT_H
#define DIALOGCOMPAT_H

#include <QDialog>
#include <QDialogButtonBox>
#include <QPalette>
#include <QWidget>

// Dialog outcome and button roles as the plugin sees them. Everything that
// talks to the widget toolkit's own enums goes through DialogCompat, so Qt
// major-version differences stay in this header.
enum class DialogResult {
    Accepted,
    Rejected
};

enum class ButtonRole {
    Accept,
    Reject,
    Help,
    Other
};

namespace DialogCompat {

inline DialogResult fromNative(int dialogCode)
{
    return dialogCode == QDialog::Accepted ? DialogResult::Accepted : DialogResult::Rejected;
}

inline int toNative(DialogResult result)
{
    return result == DialogResult::Accepted ? QDialog::Accepted : QDialog::Rejected;
}

inline QDialogButtonBox::ButtonRole toNative(ButtonRole role)
{
    switch (role) {
        case ButtonRole::Accept: return QDialogButtonBox::AcceptRole;
        case ButtonRole::Reject: return QDialogButtonBox::RejectRole;
        case ButtonRole::Help: return QDialogButtonBox::HelpRole;
        case ButtonRole::Other: break;
    }
    return QDialogButtonBox::ActionRole;
}

inline ButtonRole fromNative(QDialogButtonBox::ButtonRole role)
{
    switch (role) {
        case QDialogButtonBox::AcceptRole:
        case QDialogButtonBox::YesRole:
        case QDialogButtonBox::ApplyRole:
            return ButtonRole::Accept;
        case QDialogButtonBox::RejectRole:
        case QDialogButtonBox::NoRole:
            return ButtonRole::Reject;
        case QDialogButtonBox::HelpRole:
            return ButtonRole::Help;
        default:
            return ButtonRole::Other;
    }
}

inline qreal devicePixelRatio(const QWidget* widget)
{
    if (!widget) return 1.0;
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    const qreal dpr = widget->devicePixelRatio();
#else
    const qreal dpr = widget->devicePixelRatioF();
#endif
    return dpr > 0.0 ? dpr : 1.0;
}

inline bool isDarkPalette(const QPalette& palette)
{
    return palette.color(QPalette::Window).lightness() < 128;
}

} // namespace DialogCompat

#endif // DIALOGCOMPAT_H
