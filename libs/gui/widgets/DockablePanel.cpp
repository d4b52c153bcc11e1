#include "DockablePanel.hpp"

#include <QWidget>

DockablePanel::DockablePanel(const QString& id, const QString& title, QWidget* parent)
    : QDockWidget(title, parent)
    , m_panelId(id)
{
    setObjectName(id);  // Persistent identifier for saveState/restoreState
    setFeatures(QDockWidget::DockWidgetMovable | QDockWidget::DockWidgetFloatable | QDockWidget::DockWidgetClosable);

    m_contentWidget = new QWidget(this);
    setWidget(m_contentWidget);
}
