#include "PoolControlDock.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>

PoolControlDock::PoolControlDock(QWidget* parent)
    : DockablePanel("PoolControlDock", "", parent)  // Empty title for seamless look
{
    setTitleBarWidget(new QWidget());
    setFeatures(QDockWidget::DockWidgetFloatable);

    buildUi();
}

void PoolControlDock::buildUi() {
    QHBoxLayout* layout = new QHBoxLayout(m_contentWidget);
    layout->setContentsMargins(8, 4, 8, 4);
    layout->setSpacing(8);

    QLabel* poolLabel = new QLabel(tr("Pool:"), m_contentWidget);
    poolLabel->setStyleSheet("QLabel { color: #ccc; font-size: 11px; }");
    layout->addWidget(poolLabel);

    m_addressInput = new QLineEdit(m_contentWidget);
    m_addressInput->setPlaceholderText("0x...");
    m_addressInput->setStyleSheet(
        "QLineEdit { "
        "  padding: 4px 8px; "
        "  font-size: 11px; "
        "  background-color: #2a2a2a; "
        "  border: 1px solid #444; "
        "  border-radius: 3px; "
        "  color: white; "
        "} "
        "QLineEdit:focus { border: 1px solid #00aaff; }"
    );
    m_addressInput->setMinimumWidth(320);
    layout->addWidget(m_addressInput);

    layout->addWidget(new QLabel(tr("Chain"), m_contentWidget));
    m_chainInput = new QSpinBox(m_contentWidget);
    m_chainInput->setRange(1, 999999);
    m_chainInput->setValue(1);
    layout->addWidget(m_chainInput);

    layout->addWidget(new QLabel(tr("Dex"), m_contentWidget));
    m_dexInput = new QSpinBox(m_contentWidget);
    m_dexInput->setRange(1, 9999);
    m_dexInput->setValue(1);
    layout->addWidget(m_dexInput);

    m_loadButton = new QPushButton(tr("Load"), m_contentWidget);
    m_loadButton->setStyleSheet(
        "QPushButton { "
        "  padding: 4px 12px; "
        "  font-size: 11px; "
        "  background-color: #00aaff; "
        "  color: white; "
        "  border: none; "
        "  border-radius: 3px; "
        "} "
        "QPushButton:hover { background-color: #0088cc; } "
        "QPushButton:pressed { background-color: #006699; }"
    );
    layout->addWidget(m_loadButton);

    layout->addStretch();

    m_statusLabel = new QLabel(tr("No pool"), m_contentWidget);
    m_statusLabel->setStyleSheet("QLabel { color: #888; font-size: 10px; }");
    layout->addWidget(m_statusLabel);

    connect(m_loadButton, &QPushButton::clicked, this, &PoolControlDock::submit);
    connect(m_addressInput, &QLineEdit::returnPressed, this, &PoolControlDock::submit);

    setMaximumHeight(36);
    setMinimumHeight(36);
}

void PoolControlDock::submit() {
    PoolIdentity pool;
    pool.poolAddress = m_addressInput->text().trimmed().toStdString();
    pool.chainId = m_chainInput->value();
    pool.dexId = m_dexInput->value();
    if (!pool.isValid()) {
        setStatus(tr("Enter a pool address"), true);
        return;
    }
    emit poolRequested(pool);
}

void PoolControlDock::onPoolChanged(const PoolIdentity& pool) {
    m_addressInput->setText(QString::fromStdString(pool.poolAddress));
    m_chainInput->setValue(static_cast<int>(pool.chainId));
    m_dexInput->setValue(static_cast<int>(pool.dexId));
    setStatus(tr("Loading pool..."), false);
}

void PoolControlDock::setStatus(const QString& text, bool isError) {
    m_statusLabel->setText(text);
    m_statusLabel->setStyleSheet(isError ? "QLabel { color: #ff4444; font-size: 10px; }"
                                         : "QLabel { color: #00ff00; font-size: 10px; }");
}
