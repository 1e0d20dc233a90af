#include "ui/display_region.hpp"

#include <QLabel>
#include <QMouseEvent>
#include <QStyle>
#include <QVBoxLayout>

namespace viewport_coordinator::ui {

DisplayRegion::DisplayRegion(int index, const std::string& viewportId, QWidget* parent)
    : QWidget(parent)
    , index_(index)
    , viewportId_(viewportId)
{
    setObjectName(QString::fromStdString(viewportId_));
    setAttribute(Qt::WA_StyledBackground, true);
    setProperty("active", false);
    setStyleSheet(
        "DisplayRegion { background-color: #000000; border: 1px solid #333333; }"
        "DisplayRegion[active=\"true\"] { border: 2px solid #0078d4; }");

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);

    label_ = new QLabel(this);
    label_->setStyleSheet("color: #cccccc; background: transparent;");
    label_->setAttribute(Qt::WA_TransparentForMouseEvents, true);
    layout->addWidget(label_, 0, Qt::AlignTop | Qt::AlignLeft);
    layout->addStretch();

    updateLabel();
}

DisplayRegion::~DisplayRegion() = default;

void DisplayRegion::setIndex(int index)
{
    if (index_ == index) return;
    index_ = index;
    updateLabel();
}

void DisplayRegion::setActive(bool active)
{
    if (active_ == active) return;
    active_ = active;
    setProperty("active", active);

    // Re-evaluate the dynamic property selector
    style()->unpolish(this);
    style()->polish(this);
    update();
}

void DisplayRegion::mousePressEvent(QMouseEvent* event)
{
    emit activated(index_);
    QWidget::mousePressEvent(event);
}

void DisplayRegion::updateLabel()
{
    label_->setText(QString("Viewport %1").arg(index_ + 1));
}

} // namespace viewport_coordinator::ui
