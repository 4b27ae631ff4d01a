#include "nativeapi/X11NativeApiBackend.h"
#include "nativeapi/WindowCapture.h"
#include "raster/RasterBudget.h"

#include <QDebug>

#include <xcb/xcb.h>
#include <xcb/xproto.h>

#include <cstdlib>
#include <cstring>
#include <limits>

namespace DeskProbe {

namespace {

// xcb replies and errors are malloc'd and must be released with free().
struct FreeDeleter
{
    void operator()(void *p) const { std::free(p); }
};

template <typename T>
using XcbPtr = std::unique_ptr<T, FreeDeleter>;

struct ConnectionDeleter
{
    void operator()(xcb_connection_t *connection) const { xcb_disconnect(connection); }
};

// A null error with a null reply means the connection itself broke.
Error replyError(xcb_connection_t *connection, xcb_generic_error_t *rawError,
                 NativeStep step, const char *request)
{
    if (!rawError) {
        return Error::nativeCall(step, xcb_connection_has_error(connection),
                                 QStringLiteral("%1 failed: connection to the X server lost")
                                     .arg(QLatin1String(request)));
    }

    XcbPtr<xcb_generic_error_t> error(rawError);
    const int code = error->error_code;
    const QString message = QStringLiteral("%1 failed with X error %2")
                                .arg(QLatin1String(request))
                                .arg(code);
    if (code == XCB_WINDOW || code == XCB_DRAWABLE) {
        return Error::staleHandle(step, message, code);
    }
    return Error::nativeCall(step, code, message);
}

Result<bool> isViewable(xcb_connection_t *connection, xcb_window_t window)
{
    xcb_get_window_attributes_cookie_t cookie = xcb_get_window_attributes(connection, window);
    xcb_generic_error_t *error = nullptr;
    XcbPtr<xcb_get_window_attributes_reply_t> reply(
        xcb_get_window_attributes_reply(connection, cookie, &error));
    if (!reply) {
        return Result<bool>::failure(replyError(connection, error,
                                                NativeStep::GetWindowAttributes,
                                                "GetWindowAttributes"));
    }
    return Result<bool>::success(reply->map_state == XCB_MAP_STATE_VIEWABLE);
}

// ZPixmap GetImage of one window.
class X11CaptureSteps : public IWindowCaptureSteps
{
public:
    X11CaptureSteps(xcb_connection_t *connection, xcb_window_t window)
        : m_connection(connection)
        , m_window(window)
    {
    }

    // Size only; the origin does not matter for the copy.
    Result<WindowRect> queryRect() override
    {
        xcb_generic_error_t *error = nullptr;
        XcbPtr<xcb_get_geometry_reply_t> geometry(xcb_get_geometry_reply(
            m_connection, xcb_get_geometry(m_connection, m_window), &error));
        if (!geometry) {
            return Result<WindowRect>::failure(
                replyError(m_connection, error, NativeStep::GetWindowRect, "GetGeometry"));
        }
        return Result<WindowRect>::success(
            WindowRect{0, 0, int(geometry->width), int(geometry->height)});
    }

    // An unmapped (iconified) window has no contents to read.
    Result<Acknowledgement> checkCapturable() override
    {
        Result<bool> viewable = isViewable(m_connection, m_window);
        if (!viewable.isSuccess()) {
            return Result<Acknowledgement>::failure(viewable.error());
        }
        if (!viewable.value()) {
            return Result<Acknowledgement>::failure(Error::windowMinimized());
        }
        return Result<Acknowledgement>::success(Acknowledgement{});
    }

    Result<NativePixels> copyPixels(const WindowRect &rect) override;

private:
    xcb_connection_t *m_connection;
    xcb_window_t m_window;
};

Result<NativePixels> X11CaptureSteps::copyPixels(const WindowRect &rect)
{
    const quint32 width = quint32(rect.width());
    const quint32 height = quint32(rect.height());

    xcb_get_image_cookie_t cookie =
        xcb_get_image(m_connection, XCB_IMAGE_FORMAT_Z_PIXMAP, m_window, 0, 0,
                      uint16_t(width), uint16_t(height), ~0u);
    xcb_generic_error_t *error = nullptr;
    XcbPtr<xcb_get_image_reply_t> image(xcb_get_image_reply(m_connection, cookie, &error));
    if (!image) {
        return Result<NativePixels>::failure(
            replyError(m_connection, error, NativeStep::GetImage, "GetImage"));
    }

    const std::size_t byteCount = std::size_t(xcb_get_image_data_length(image.get()));
    const bool lsbFirst = xcb_get_setup(m_connection)->image_byte_order == XCB_IMAGE_ORDER_LSB_FIRST;
    Result<bool> hasAlpha =
        WindowCapture::checkZPixmapLayout(lsbFirst, image->depth, byteCount, width, height);
    if (!hasAlpha.isSuccess()) {
        return Result<NativePixels>::failure(hasAlpha.error());
    }

    const uchar *data = xcb_get_image_data(image.get());
    NativePixels pixels;
    pixels.width = width;
    pixels.height = height;
    pixels.bgra.assign(data, data + byteCount);
    pixels.hasAlpha = hasAlpha.value();
    return Result<NativePixels>::success(std::move(pixels));
}

} // namespace

class X11NativeApiBackend::Private
{
public:
    explicit Private(std::shared_ptr<RasterBudget> b) : budget(std::move(b)) {}

    Result<xcb_atom_t> internAtom(const char *name);
    Result<xcb_window_t> toWindow(WindowHandle handle) const;

    std::shared_ptr<RasterBudget> budget;
    std::unique_ptr<xcb_connection_t, ConnectionDeleter> connection;
    xcb_window_t root = XCB_WINDOW_NONE;
    xcb_atom_t netWmName = XCB_ATOM_NONE;
    xcb_atom_t utf8String = XCB_ATOM_NONE;
};

Result<xcb_atom_t> X11NativeApiBackend::Private::internAtom(const char *name)
{
    xcb_intern_atom_cookie_t cookie =
        xcb_intern_atom(connection.get(), 0, uint16_t(std::strlen(name)), name);
    xcb_generic_error_t *error = nullptr;
    XcbPtr<xcb_intern_atom_reply_t> reply(xcb_intern_atom_reply(connection.get(), cookie, &error));
    if (!reply) {
        return Result<xcb_atom_t>::failure(
            replyError(connection.get(), error, NativeStep::InternAtom, "InternAtom"));
    }
    return Result<xcb_atom_t>::success(reply->atom);
}

Result<xcb_window_t> X11NativeApiBackend::Private::toWindow(WindowHandle handle) const
{
    if (handle.value() > std::numeric_limits<uint32_t>::max()) {
        return Result<xcb_window_t>::failure(Error::staleHandle(
            NativeStep::CheckHandle,
            QStringLiteral("Handle %1 is not an X11 window id").arg(handle.value())));
    }
    return Result<xcb_window_t>::success(xcb_window_t(handle.value()));
}

X11NativeApiBackend::X11NativeApiBackend(std::shared_ptr<RasterBudget> budget)
    : d(new Private(std::move(budget)))
{
}

X11NativeApiBackend::~X11NativeApiBackend()
{
    delete d;
}

QString X11NativeApiBackend::backendName() const
{
    return QStringLiteral("X11");
}

Result<Acknowledgement> X11NativeApiBackend::initialize()
{
    int screenNumber = 0;
    d->connection.reset(xcb_connect(nullptr, &screenNumber));
    if (const int code = xcb_connection_has_error(d->connection.get())) {
        d->connection.reset();
        qWarning() << "X11NativeApiBackend: Cannot connect to the X server, error" << code;
        return Result<Acknowledgement>::failure(Error::nativeCall(
            NativeStep::Connect, code, QStringLiteral("Cannot connect to the X server")));
    }

    xcb_screen_iterator_t it = xcb_setup_roots_iterator(xcb_get_setup(d->connection.get()));
    for (int i = 0; i < screenNumber && it.rem > 0; ++i) {
        xcb_screen_next(&it);
    }
    if (it.rem <= 0 || !it.data) {
        return Result<Acknowledgement>::failure(Error::nativeCall(
            NativeStep::Connect, 0,
            QStringLiteral("X server reports no screen %1").arg(screenNumber)));
    }
    d->root = it.data->root;

    Result<xcb_atom_t> netWmName = d->internAtom("_NET_WM_NAME");
    if (!netWmName.isSuccess()) {
        return Result<Acknowledgement>::failure(netWmName.error());
    }
    Result<xcb_atom_t> utf8String = d->internAtom("UTF8_STRING");
    if (!utf8String.isSuccess()) {
        return Result<Acknowledgement>::failure(utf8String.error());
    }
    d->netWmName = netWmName.value();
    d->utf8String = utf8String.value();

    qDebug() << "X11NativeApiBackend: Connected, screen" << screenNumber << "root" << d->root;
    return Result<Acknowledgement>::success(Acknowledgement{});
}

Result<std::vector<WindowHandle>> X11NativeApiBackend::enumerateWindows()
{
    xcb_connection_t *c = d->connection.get();

    xcb_generic_error_t *error = nullptr;
    XcbPtr<xcb_query_tree_reply_t> tree(
        xcb_query_tree_reply(c, xcb_query_tree(c, d->root), &error));
    if (!tree) {
        Error failure = replyError(c, error, NativeStep::EnumerateWindows, "QueryTree");
        qWarning() << "X11NativeApiBackend:" << failure.toString();
        return Result<std::vector<WindowHandle>>::failure(failure);
    }

    const xcb_window_t *children = xcb_query_tree_children(tree.get());
    const int childCount = xcb_query_tree_children_length(tree.get());

    // Send every request before reading any reply.
    std::vector<xcb_get_window_attributes_cookie_t> attributeCookies;
    attributeCookies.reserve(std::size_t(childCount));
    for (int i = 0; i < childCount; ++i) {
        attributeCookies.push_back(xcb_get_window_attributes(c, children[i]));
    }

    std::vector<xcb_window_t> viewable;
    for (int i = 0; i < childCount; ++i) {
        xcb_generic_error_t *attributeError = nullptr;
        XcbPtr<xcb_get_window_attributes_reply_t> attributes(
            xcb_get_window_attributes_reply(c, attributeCookies[std::size_t(i)], &attributeError));
        // Windows destroyed since QueryTree are skipped.
        XcbPtr<xcb_generic_error_t> discarded(attributeError);
        if (attributes && attributes->map_state == XCB_MAP_STATE_VIEWABLE) {
            viewable.push_back(children[i]);
        }
    }

    std::vector<xcb_get_property_cookie_t> titleCookies;
    titleCookies.reserve(viewable.size());
    for (xcb_window_t window : viewable) {
        titleCookies.push_back(
            xcb_get_property(c, 0, window, d->netWmName, XCB_GET_PROPERTY_TYPE_ANY, 0, 1024));
    }

    std::vector<WindowHandle> handles;
    for (std::size_t i = 0; i < viewable.size(); ++i) {
        xcb_generic_error_t *titleError = nullptr;
        XcbPtr<xcb_get_property_reply_t> title(
            xcb_get_property_reply(c, titleCookies[i], &titleError));
        XcbPtr<xcb_generic_error_t> discarded(titleError);
        if (title && xcb_get_property_value_length(title.get()) > 0) {
            handles.push_back(WindowHandle(viewable[i]));
        }
    }
    return Result<std::vector<WindowHandle>>::success(std::move(handles));
}

Result<QString> X11NativeApiBackend::windowTitle(WindowHandle handle)
{
    Result<xcb_window_t> window = d->toWindow(handle);
    if (!window.isSuccess()) {
        return Result<QString>::failure(window.error());
    }

    xcb_connection_t *c = d->connection.get();
    xcb_get_property_cookie_t cookie =
        xcb_get_property(c, 0, window.value(), d->netWmName, d->utf8String, 0,
                         std::numeric_limits<uint32_t>::max());
    xcb_generic_error_t *error = nullptr;
    XcbPtr<xcb_get_property_reply_t> reply(xcb_get_property_reply(c, cookie, &error));
    if (!reply) {
        return Result<QString>::failure(
            replyError(c, error, NativeStep::GetWindowTitle, "GetProperty(_NET_WM_NAME)"));
    }

    const int length = xcb_get_property_value_length(reply.get());
    const char *value = static_cast<const char *>(xcb_get_property_value(reply.get()));
    return Result<QString>::success(QString::fromUtf8(value, length));
}

Result<WindowRect> X11NativeApiBackend::windowRect(WindowHandle handle)
{
    Result<xcb_window_t> window = d->toWindow(handle);
    if (!window.isSuccess()) {
        return Result<WindowRect>::failure(window.error());
    }

    xcb_connection_t *c = d->connection.get();
    xcb_generic_error_t *error = nullptr;
    XcbPtr<xcb_get_geometry_reply_t> geometry(
        xcb_get_geometry_reply(c, xcb_get_geometry(c, window.value()), &error));
    if (!geometry) {
        return Result<WindowRect>::failure(
            replyError(c, error, NativeStep::GetWindowRect, "GetGeometry"));
    }

    // Geometry is parent-relative; the origin is reported in root coordinates.
    XcbPtr<xcb_translate_coordinates_reply_t> translated(xcb_translate_coordinates_reply(
        c, xcb_translate_coordinates(c, window.value(), d->root, 0, 0), &error));
    if (!translated) {
        return Result<WindowRect>::failure(
            replyError(c, error, NativeStep::TranslateCoordinates, "TranslateCoordinates"));
    }

    const int left = translated->dst_x;
    const int top = translated->dst_y;
    return Result<WindowRect>::success(
        WindowRect{left, top, left + int(geometry->width), top + int(geometry->height)});
}

Result<bool> X11NativeApiBackend::isWindowFocused(WindowHandle handle)
{
    xcb_connection_t *c = d->connection.get();
    xcb_generic_error_t *error = nullptr;
    XcbPtr<xcb_get_input_focus_reply_t> reply(
        xcb_get_input_focus_reply(c, xcb_get_input_focus(c), &error));
    if (!reply) {
        return Result<bool>::failure(
            replyError(c, error, NativeStep::GetInputFocus, "GetInputFocus"));
    }
    return Result<bool>::success(quint64(reply->focus) == handle.value());
}

Result<Raster> X11NativeApiBackend::captureWindowImage(WindowHandle handle)
{
    Result<xcb_window_t> window = d->toWindow(handle);
    if (!window.isSuccess()) {
        return Result<Raster>::failure(window.error());
    }

    X11CaptureSteps steps(d->connection.get(), window.value());
    return WindowCapture::run(steps, d->budget);
}

} // namespace DeskProbe
