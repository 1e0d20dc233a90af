#include "services/annotation/annotation_store.hpp"
#include <kcenon/common/logging/log_macros.h>

#include <algorithm>
#include <format>
#include <stdexcept>

#include <QPointer>
#include <QWidget>

namespace viewport_coordinator::services {

AnnotationSnapshot makeSnapshot(const Annotation& annotation)
{
    AnnotationSnapshot snapshot;
    snapshot.annotationId = annotation.annotationId;
    snapshot.toolName = annotation.toolName;
    snapshot.payload = {
        {"data", annotation.data},
        {"metadata", annotation.metadata},
    };
    snapshot.sourceViewportId = annotation.viewportId;
    snapshot.imageId = annotation.frameKey;
    return snapshot;
}

Annotation fromSnapshot(const AnnotationSnapshot& snapshot,
                        const std::string& targetViewportId)
{
    Annotation annotation;
    annotation.annotationId = snapshot.annotationId;
    annotation.toolName = snapshot.toolName;
    annotation.frameKey = snapshot.imageId;
    annotation.viewportId = targetViewportId;
    if (snapshot.payload.contains("data")) {
        annotation.data = snapshot.payload.at("data");
    }
    if (snapshot.payload.contains("metadata")) {
        annotation.metadata = snapshot.payload.at("metadata");
    }
    return annotation;
}

// ============================================================================
// AnnotationStore
// ============================================================================

class AnnotationStore::Impl {
public:
    struct Record {
        Annotation annotation;
        QPointer<QWidget> surface;
    };

    // Insertion order preserved for stable getAll() output
    std::vector<Record> records_;

    std::vector<Record>::iterator find(const std::string& id) {
        return std::find_if(records_.begin(), records_.end(),
            [&id](const Record& r) { return r.annotation.annotationId == id; });
    }

    std::vector<Record>::const_iterator find(const std::string& id) const {
        return std::find_if(records_.begin(), records_.end(),
            [&id](const Record& r) { return r.annotation.annotationId == id; });
    }
};

AnnotationStore::AnnotationStore()
    : impl_(std::make_unique<Impl>())
{
}

AnnotationStore::~AnnotationStore() = default;

AnnotationIndex AnnotationStore::getAll() const
{
    AnnotationIndex index;
    for (const auto& record : impl_->records_) {
        index[record.annotation.frameKey][record.annotation.toolName].push_back(record.annotation);
    }
    return index;
}

void AnnotationStore::removeAll()
{
    if (!impl_->records_.empty()) {
        LOG_DEBUG(std::format("Removing {} annotations", impl_->records_.size()));
    }
    impl_->records_.clear();
}

void AnnotationStore::add(const Annotation& annotation, QWidget* surface)
{
    if (!surface) {
        throw std::invalid_argument(
            std::format("No display surface for annotation '{}'", annotation.annotationId));
    }
    if (annotation.annotationId.empty()) {
        throw std::invalid_argument("Annotation id must not be empty");
    }

    auto it = impl_->find(annotation.annotationId);
    if (it != impl_->records_.end()) {
        it->annotation = annotation;
        it->surface = surface;
        return;
    }
    impl_->records_.push_back({annotation, surface});
}

size_t AnnotationStore::count() const noexcept
{
    return impl_->records_.size();
}

std::optional<Annotation> AnnotationStore::find(const std::string& annotationId) const
{
    auto it = impl_->find(annotationId);
    if (it == impl_->records_.end()) {
        return std::nullopt;
    }
    return it->annotation;
}

bool AnnotationStore::remove(const std::string& annotationId)
{
    auto it = impl_->find(annotationId);
    if (it == impl_->records_.end()) {
        return false;
    }
    impl_->records_.erase(it);
    return true;
}

QWidget* AnnotationStore::surfaceOf(const std::string& annotationId) const
{
    auto it = impl_->find(annotationId);
    return it != impl_->records_.end() ? it->surface.data() : nullptr;
}

} // namespace viewport_coordinator::services
