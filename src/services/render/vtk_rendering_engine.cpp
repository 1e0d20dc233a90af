#include "services/render/vtk_rendering_engine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

#include <QBoxLayout>
#include <QPointer>
#include <QVBoxLayout>
#include <QVTKOpenGLNativeWidget.h>
#include <QWidget>

#include <vtkCallbackCommand.h>
#include <vtkCamera.h>
#include <vtkCommand.h>
#include <vtkGenericOpenGLRenderWindow.h>
#include <vtkImageProperty.h>
#include <vtkImageSlice.h>
#include <vtkImageSliceMapper.h>
#include <vtkInteractorStyleImage.h>
#include <vtkInteractorStyleTrackballCamera.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>

#include "core/logging.hpp"

namespace {

auto& getLogger() {
    static auto logger =
        viewport_coordinator::logging::LoggerFactory::create("VtkRenderingEngine");
    return logger;
}

}  // anonymous namespace

namespace viewport_coordinator::services {

Camera cameraFromVtk(vtkCamera* camera)
{
    Camera result;
    camera->GetPosition(result.position.data());
    camera->GetFocalPoint(result.focalPoint.data());
    camera->GetViewUp(result.viewUp.data());
    result.parallelScale = camera->GetParallelScale();
    result.viewAngle = camera->GetViewAngle();
    result.parallelProjection = camera->GetParallelProjection() != 0;
    return result;
}

void applyCameraToVtk(const Camera& camera, vtkCamera* target)
{
    target->SetPosition(camera.position.data());
    target->SetFocalPoint(camera.focalPoint.data());
    target->SetViewUp(camera.viewUp.data());
    target->SetParallelScale(camera.parallelScale);
    target->SetViewAngle(camera.viewAngle);
    target->SetParallelProjection(camera.parallelProjection ? 1 : 0);
}

// =============================================================================
// VtkRenderingEngine::Impl
// =============================================================================

class VtkRenderingEngine::Impl {
public:
    struct Observer {
        ObserverId id = 0;
        RenderEvent event = RenderEvent::CameraModified;
        EventCallback callback;
    };

    struct Binding {
        std::string viewportId;
        RenderHandle handle;
        ViewportKind kind = ViewportKind::Stack;
        QPointer<QWidget> surface;
        QPointer<QVTKOpenGLNativeWidget> vtkWidget;
        vtkSmartPointer<vtkGenericOpenGLRenderWindow> renderWindow;
        vtkSmartPointer<vtkRenderer> renderer;
        vtkSmartPointer<vtkImageSliceMapper> sliceMapper;
        vtkSmartPointer<vtkImageSlice> imageSlice;
        vtkSmartPointer<vtkImageProperty> imageProperty;
        vtkSmartPointer<vtkCallbackCommand> cameraCallback;
        unsigned long cameraObserverTag = 0;

        std::optional<VoiRange> voiRange;
        bool invert = false;
        bool flipHorizontal = false;
        bool flipVertical = false;
        std::optional<std::string> imageId;

        // Suppresses per-setter ModifiedEvents while a whole camera is applied
        bool applyingCamera = false;

        std::vector<Observer> observers;
        Impl* owner = nullptr;
    };

    Options options;
    std::map<std::uint64_t, std::unique_ptr<Binding>> bindings;
    std::map<std::string, std::uint64_t> handlesById;
    std::map<std::string, vtkSmartPointer<vtkImageData>> imageCache;
    std::uint64_t nextHandle = 1;
    ObserverId nextObserver = 1;

    Binding& lookup(RenderHandle handle) const {
        auto it = bindings.find(handle.value);
        if (it == bindings.end()) {
            throw std::out_of_range("Unknown render handle " + std::to_string(handle.value));
        }
        return *it->second;
    }

    void fire(Binding& binding, RenderEvent event) {
        // Observers may detach themselves while being notified
        std::vector<EventCallback> callbacks;
        for (const auto& observer : binding.observers) {
            if (observer.event == event) callbacks.push_back(observer.callback);
        }
        const std::string viewportId = binding.viewportId;
        for (const auto& callback : callbacks) {
            callback(viewportId, event);
        }
    }

    static void onCameraModified(vtkObject*, unsigned long, void* clientData, void*) {
        auto* binding = static_cast<Binding*>(clientData);
        if (binding->applyingCamera) return;
        binding->owner->fire(*binding, RenderEvent::CameraModified);
    }

    static void orientCamera(vtkCamera* camera, SliceOrientation orientation) {
        camera->SetFocalPoint(0.0, 0.0, 0.0);
        switch (orientation) {
            case SliceOrientation::Axial:
                camera->SetPosition(0.0, 0.0, 1.0);
                camera->SetViewUp(0.0, 1.0, 0.0);
                break;
            case SliceOrientation::Sagittal:
                camera->SetPosition(1.0, 0.0, 0.0);
                camera->SetViewUp(0.0, 0.0, 1.0);
                break;
            case SliceOrientation::Coronal:
                camera->SetPosition(0.0, -1.0, 0.0);
                camera->SetViewUp(0.0, 0.0, 1.0);
                break;
        }
    }

    void attachRenderWindow(Binding& binding) {
        binding.renderWindow = vtkSmartPointer<vtkGenericOpenGLRenderWindow>::New();
        binding.renderWindow->AddRenderer(binding.renderer);

        binding.vtkWidget = new QVTKOpenGLNativeWidget(binding.surface);
        binding.vtkWidget->setRenderWindow(binding.renderWindow);

        if (auto* box = qobject_cast<QBoxLayout*>(binding.surface->layout())) {
            box->addWidget(binding.vtkWidget, 1);
        } else if (!binding.surface->layout()) {
            auto* layout = new QVBoxLayout(binding.surface);
            layout->setContentsMargins(0, 0, 0, 0);
            layout->addWidget(binding.vtkWidget);
        }

        if (auto* interactor = binding.renderWindow->GetInteractor()) {
            if (binding.kind == ViewportKind::Volume3D) {
                interactor->SetInteractorStyle(
                    vtkSmartPointer<vtkInteractorStyleTrackballCamera>::New());
            } else {
                interactor->SetInteractorStyle(vtkSmartPointer<vtkInteractorStyleImage>::New());
            }
        }
    }
};

// =============================================================================
// VtkRenderingEngine
// =============================================================================

VtkRenderingEngine::VtkRenderingEngine()
    : VtkRenderingEngine(Options{})
{
}

VtkRenderingEngine::VtkRenderingEngine(const Options& options)
    : impl_(std::make_unique<Impl>())
{
    impl_->options = options;
}

VtkRenderingEngine::~VtkRenderingEngine()
{
    std::vector<std::string> ids;
    for (const auto& [id, handle] : impl_->handlesById) {
        ids.push_back(id);
    }
    for (const auto& id : ids) {
        unbind(id);
    }
}

RenderHandle VtkRenderingEngine::bind(const std::string& viewportId, QWidget* surface,
                                      ViewportKind kind, const ViewportOptions& options)
{
    if (!surface) {
        throw std::invalid_argument("Cannot bind viewport " + viewportId + " without a surface");
    }
    if (auto existing = getHandle(viewportId)) {
        return *existing;
    }

    auto binding = std::make_unique<Impl::Binding>();
    binding->owner = impl_.get();
    binding->viewportId = viewportId;
    binding->handle = RenderHandle{impl_->nextHandle++};
    binding->kind = kind;
    binding->surface = surface;

    binding->renderer = vtkSmartPointer<vtkRenderer>::New();
    binding->renderer->SetBackground(options.background[0], options.background[1],
                                     options.background[2]);

    auto* camera = binding->renderer->GetActiveCamera();
    camera->SetParallelProjection(kind == ViewportKind::Volume3D ? 0 : 1);
    Impl::orientCamera(camera, options.orientation);

    binding->imageProperty = vtkSmartPointer<vtkImageProperty>::New();
    binding->imageProperty->SetInterpolationTypeToLinear();
    binding->sliceMapper = vtkSmartPointer<vtkImageSliceMapper>::New();
    binding->imageSlice = vtkSmartPointer<vtkImageSlice>::New();
    binding->imageSlice->SetMapper(binding->sliceMapper);
    binding->imageSlice->SetProperty(binding->imageProperty);

    binding->cameraCallback = vtkSmartPointer<vtkCallbackCommand>::New();
    binding->cameraCallback->SetCallback(&Impl::onCameraModified);
    binding->cameraCallback->SetClientData(binding.get());
    binding->cameraObserverTag =
        camera->AddObserver(vtkCommand::ModifiedEvent, binding->cameraCallback);

    if (impl_->options.attachRenderWindows) {
        impl_->attachRenderWindow(*binding);
    }

    const auto handle = binding->handle;
    impl_->handlesById[viewportId] = handle.value;
    impl_->bindings[handle.value] = std::move(binding);

    getLogger()->debug("Bound viewport {} (handle={})", viewportId, handle.value);
    return handle;
}

void VtkRenderingEngine::unbind(const std::string& viewportId)
{
    auto idIt = impl_->handlesById.find(viewportId);
    if (idIt == impl_->handlesById.end()) {
        return;
    }

    auto it = impl_->bindings.find(idIt->second);
    if (it != impl_->bindings.end()) {
        auto& binding = *it->second;
        binding.renderer->GetActiveCamera()->RemoveObserver(binding.cameraObserverTag);
        binding.observers.clear();
        if (binding.renderWindow) {
            binding.renderWindow->RemoveRenderer(binding.renderer);
        }
        if (binding.vtkWidget) {
            binding.vtkWidget->hide();
            binding.vtkWidget->deleteLater();
        }
        impl_->bindings.erase(it);
    }
    impl_->handlesById.erase(idIt);

    getLogger()->debug("Unbound viewport {}", viewportId);
}

std::optional<RenderHandle> VtkRenderingEngine::getHandle(const std::string& viewportId) const
{
    auto it = impl_->handlesById.find(viewportId);
    if (it == impl_->handlesById.end()) {
        return std::nullopt;
    }
    return RenderHandle{it->second};
}

Camera VtkRenderingEngine::getCamera(RenderHandle handle) const
{
    const auto& binding = impl_->lookup(handle);
    auto camera = cameraFromVtk(binding.renderer->GetActiveCamera());
    camera.flipHorizontal = binding.flipHorizontal;
    camera.flipVertical = binding.flipVertical;
    return camera;
}

void VtkRenderingEngine::setCamera(RenderHandle handle, const Camera& camera)
{
    auto& binding = impl_->lookup(handle);
    if (!camera.isValid()) {
        throw std::invalid_argument("Invalid camera for viewport " + binding.viewportId);
    }

    binding.applyingCamera = true;
    applyCameraToVtk(camera, binding.renderer->GetActiveCamera());
    binding.flipHorizontal = camera.flipHorizontal;
    binding.flipVertical = camera.flipVertical;
    binding.renderer->ResetCameraClippingRange();
    binding.applyingCamera = false;

    impl_->fire(binding, RenderEvent::CameraModified);
}

ViewportProperties VtkRenderingEngine::getProperties(RenderHandle handle) const
{
    const auto& binding = impl_->lookup(handle);
    ViewportProperties properties;
    properties.voiRange = binding.voiRange;
    properties.invert = binding.invert;
    properties.interpolation =
        binding.imageProperty->GetInterpolationType() == VTK_NEAREST_INTERPOLATION
            ? InterpolationType::Nearest
            : InterpolationType::Linear;
    return properties;
}

void VtkRenderingEngine::setProperties(RenderHandle handle, const ViewportProperties& properties)
{
    auto& binding = impl_->lookup(handle);
    const bool voiChanged = binding.voiRange != properties.voiRange
        || binding.invert != properties.invert;

    binding.voiRange = properties.voiRange;
    binding.invert = properties.invert;

    if (binding.voiRange) {
        // A negative window inverts the grey scale
        const double window = binding.voiRange->window();
        binding.imageProperty->SetColorWindow(binding.invert ? -window : window);
        binding.imageProperty->SetColorLevel(binding.voiRange->level());
    }

    if (properties.interpolation == InterpolationType::Nearest) {
        binding.imageProperty->SetInterpolationTypeToNearest();
    } else {
        binding.imageProperty->SetInterpolationTypeToLinear();
    }

    if (voiChanged) {
        impl_->fire(binding, RenderEvent::VoiModified);
    }
}

std::optional<std::string> VtkRenderingEngine::currentImageId(RenderHandle handle) const
{
    return impl_->lookup(handle).imageId;
}

void VtkRenderingEngine::render(RenderHandle handle)
{
    auto& binding = impl_->lookup(handle);
    if (binding.renderWindow && binding.vtkWidget && binding.vtkWidget->isVisible()) {
        binding.renderWindow->Render();
    }
    impl_->fire(binding, RenderEvent::ImageRendered);
}

void VtkRenderingEngine::renderAll()
{
    std::vector<RenderHandle> handles;
    for (const auto& [value, binding] : impl_->bindings) {
        handles.push_back(binding->handle);
    }
    for (auto handle : handles) {
        render(handle);
    }
}

ObserverId VtkRenderingEngine::addObserver(RenderHandle handle, RenderEvent event,
                                           EventCallback callback)
{
    auto& binding = impl_->lookup(handle);
    const ObserverId id = impl_->nextObserver++;
    binding.observers.push_back({id, event, std::move(callback)});
    return id;
}

bool VtkRenderingEngine::removeObserver(RenderHandle handle, ObserverId observer)
{
    auto it = impl_->bindings.find(handle.value);
    if (it == impl_->bindings.end()) {
        return false;
    }
    return std::erase_if(it->second->observers,
        [observer](const Impl::Observer& o) { return o.id == observer; }) > 0;
}

std::optional<std::size_t> VtkRenderingEngine::purgeCache()
{
    std::set<std::string> inUse;
    for (const auto& [value, binding] : impl_->bindings) {
        if (binding->imageId) inUse.insert(*binding->imageId);
    }

    std::size_t released = 0;
    size_t purged = 0;
    for (auto it = impl_->imageCache.begin(); it != impl_->imageCache.end();) {
        if (inUse.contains(it->first)) {
            ++it;
            continue;
        }
        if (it->second) {
            // GetActualMemorySize() reports kibibytes
            released += static_cast<std::size_t>(it->second->GetActualMemorySize()) * 1024;
        }
        it = impl_->imageCache.erase(it);
        ++purged;
    }

    getLogger()->info("Purged {} cached images ({} bytes)", purged, released);
    return released;
}

void VtkRenderingEngine::setImageData(RenderHandle handle, vtkSmartPointer<vtkImageData> image,
                                      const std::string& imageId)
{
    auto& binding = impl_->lookup(handle);
    binding.sliceMapper->SetInputData(image);
    if (!binding.renderer->HasViewProp(binding.imageSlice)) {
        binding.renderer->AddViewProp(binding.imageSlice);
    }
    binding.imageId = imageId;
    impl_->imageCache[imageId] = image;

    binding.applyingCamera = true;
    binding.renderer->ResetCamera();
    binding.applyingCamera = false;
    impl_->fire(binding, RenderEvent::CameraModified);
}

vtkRenderer* VtkRenderingEngine::renderer(RenderHandle handle) const
{
    auto it = impl_->bindings.find(handle.value);
    return it != impl_->bindings.end() ? it->second->renderer.Get() : nullptr;
}

size_t VtkRenderingEngine::bindingCount() const noexcept
{
    return impl_->bindings.size();
}

size_t VtkRenderingEngine::cachedImageCount() const noexcept
{
    return impl_->imageCache.size();
}

}  // namespace viewport_coordinator::services
