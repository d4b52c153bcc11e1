#pragma once

#include "DockablePanel.hpp"

class QLabel;
class QLineEdit;
class QPushButton;
class QSpinBox;

/**
 * Compact pool selector: address, chain id and dex id inputs with a Load button.
 * Emits poolRequested only for a complete identity.
 */
class PoolControlDock : public DockablePanel {
    Q_OBJECT

public:
    explicit PoolControlDock(QWidget* parent = nullptr);
    ~PoolControlDock() override = default;

    void buildUi() override;
    void onPoolChanged(const PoolIdentity& pool) override;

    void setStatus(const QString& text, bool isError);

signals:
    void poolRequested(const PoolIdentity& pool);

private:
    void submit();

    QLineEdit* m_addressInput = nullptr;
    QSpinBox* m_chainInput = nullptr;
    QSpinBox* m_dexInput = nullptr;
    QPushButton* m_loadButton = nullptr;
    QLabel* m_statusLabel = nullptr;
};
