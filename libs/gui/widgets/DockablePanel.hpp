#pragma once

#include <QDockWidget>
#include <QString>

#include "pool/PoolTypes.hpp"

/**
 * Base class for all dockable panels in RangeScope.
 * Provides consistent dock behavior and pool change propagation.
 */
class DockablePanel : public QDockWidget {
    Q_OBJECT

public:
    explicit DockablePanel(const QString& id, const QString& title, QWidget* parent = nullptr);
    ~DockablePanel() override = default;

    QString panelId() const { return m_panelId; }

    /**
     * Builds the panel UI into m_contentWidget.
     * Called once by the subclass constructor.
     */
    virtual void buildUi() = 0;

    /**
     * Hook for pool switches. Panels drop pool-specific display state here.
     */
    virtual void onPoolChanged(const PoolIdentity& pool) { Q_UNUSED(pool); }

protected:
    QString m_panelId;
    QWidget* m_contentWidget = nullptr;
};
