#include "nativeapi/Win32NativeApiBackend.h"
#include "nativeapi/WindowCapture.h"
#include "raster/RasterBudget.h"

#include <QDebug>

#include <windows.h>

#include <vector>

namespace DeskProbe {

namespace {

constexpr int kTitleBufferLength = 512;

HWND toHwnd(WindowHandle handle)
{
    return reinterpret_cast<HWND>(static_cast<quintptr>(handle.value()));
}

WindowHandle fromHwnd(HWND hwnd)
{
    return WindowHandle(static_cast<quint64>(reinterpret_cast<quintptr>(hwnd)));
}

// GetLastError() mapped to an Error; a dead HWND becomes StaleHandle.
Error lastError(NativeStep step, const char *call)
{
    const DWORD code = GetLastError();
    const QString message = QStringLiteral("%1 failed").arg(QLatin1String(call));
    if (code == ERROR_INVALID_WINDOW_HANDLE) {
        return Error::staleHandle(step, message, qint64(code));
    }
    return Error::nativeCall(step, qint64(code), message);
}

// Scoped GetWindowDC / ReleaseDC
class WindowDc
{
public:
    explicit WindowDc(HWND hwnd) : m_hwnd(hwnd), m_dc(GetWindowDC(hwnd)) {}
    ~WindowDc()
    {
        if (m_dc) {
            ReleaseDC(m_hwnd, m_dc);
        }
    }
    WindowDc(const WindowDc &) = delete;
    WindowDc &operator=(const WindowDc &) = delete;

    HDC get() const { return m_dc; }

private:
    HWND m_hwnd;
    HDC m_dc;
};

// Scoped CreateCompatibleDC / DeleteDC
class MemoryDc
{
public:
    explicit MemoryDc(HDC source) : m_dc(CreateCompatibleDC(source)) {}
    ~MemoryDc()
    {
        if (m_dc) {
            DeleteDC(m_dc);
        }
    }
    MemoryDc(const MemoryDc &) = delete;
    MemoryDc &operator=(const MemoryDc &) = delete;

    HDC get() const { return m_dc; }

private:
    HDC m_dc;
};

// Scoped CreateCompatibleBitmap / DeleteObject
class CompatibleBitmap
{
public:
    CompatibleBitmap(HDC source, int width, int height)
        : m_bitmap(CreateCompatibleBitmap(source, width, height))
    {
    }
    ~CompatibleBitmap()
    {
        if (m_bitmap) {
            DeleteObject(m_bitmap);
        }
    }
    CompatibleBitmap(const CompatibleBitmap &) = delete;
    CompatibleBitmap &operator=(const CompatibleBitmap &) = delete;

    HBITMAP get() const { return m_bitmap; }

private:
    HBITMAP m_bitmap;
};

// Selects an object into a DC and puts the previous one back on scope exit.
// Must be destroyed before the bitmap it selected.
class SelectionGuard
{
public:
    SelectionGuard(HDC dc, HGDIOBJ object) : m_dc(dc), m_previous(SelectObject(dc, object)) {}
    ~SelectionGuard()
    {
        if (m_previous) {
            SelectObject(m_dc, m_previous);
        }
    }
    SelectionGuard(const SelectionGuard &) = delete;
    SelectionGuard &operator=(const SelectionGuard &) = delete;

private:
    HDC m_dc;
    HGDIOBJ m_previous;
};

BOOL CALLBACK collectTitledWindows(HWND hwnd, LPARAM lParam)
{
    auto *handles = reinterpret_cast<std::vector<WindowHandle> *>(lParam);

    if (!IsWindowVisible(hwnd)) {
        return TRUE;
    }

    WCHAR title[kTitleBufferLength];
    if (GetWindowTextW(hwnd, title, kTitleBufferLength) > 0) {
        handles->push_back(fromHwnd(hwnd));
    }
    return TRUE;
}

Result<RECT> queryWindowRect(HWND hwnd)
{
    RECT rect;
    if (!GetWindowRect(hwnd, &rect)) {
        return Result<RECT>::failure(lastError(NativeStep::GetWindowRect, "GetWindowRect"));
    }
    return Result<RECT>::success(rect);
}

// Minimized windows report a -32000 origin and paint nothing useful.
Result<Acknowledgement> checkWindowCapturable(HWND hwnd)
{
    if (IsIconic(hwnd)) {
        return Result<Acknowledgement>::failure(Error::windowMinimized());
    }
    if (!IsWindow(hwnd)) {
        return Result<Acknowledgement>::failure(
            Error::staleHandle(NativeStep::CheckHandle, QStringLiteral("Window handle is no longer valid")));
    }
    return Result<Acknowledgement>::success(Acknowledgement{});
}

// GetWindowDC + BitBlt into a compatible bitmap, read back with GetDIBits.
class Win32CaptureSteps : public IWindowCaptureSteps
{
public:
    explicit Win32CaptureSteps(HWND hwnd) : m_hwnd(hwnd) {}

    Result<WindowRect> queryRect() override
    {
        return queryWindowRect(m_hwnd).map([](const RECT &rect) {
            return WindowRect{int(rect.left), int(rect.top), int(rect.right), int(rect.bottom)};
        });
    }

    Result<Acknowledgement> checkCapturable() override { return checkWindowCapturable(m_hwnd); }

    Result<NativePixels> copyPixels(const WindowRect &rect) override;

private:
    HWND m_hwnd;
};

Result<NativePixels> Win32CaptureSteps::copyPixels(const WindowRect &rect)
{
    const int width = rect.width();
    const int height = rect.height();

    WindowDc windowDc(m_hwnd);
    if (!windowDc.get()) {
        return Result<NativePixels>::failure(lastError(NativeStep::GetWindowDc, "GetWindowDC"));
    }
    MemoryDc memoryDc(windowDc.get());
    if (!memoryDc.get()) {
        return Result<NativePixels>::failure(
            lastError(NativeStep::CreateCompatibleDc, "CreateCompatibleDC"));
    }
    CompatibleBitmap bitmap(windowDc.get(), width, height);
    if (!bitmap.get()) {
        return Result<NativePixels>::failure(
            lastError(NativeStep::CreateCompatibleBitmap, "CreateCompatibleBitmap"));
    }

    {
        SelectionGuard selection(memoryDc.get(), bitmap.get());
        if (!BitBlt(memoryDc.get(), 0, 0, width, height, windowDc.get(), 0, 0, SRCCOPY)) {
            return Result<NativePixels>::failure(lastError(NativeStep::CopyBits, "BitBlt"));
        }
    }

    BITMAPINFO bmi;
    ZeroMemory(&bmi, sizeof(bmi));
    bmi.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    bmi.bmiHeader.biWidth = width;
    bmi.bmiHeader.biHeight = -height;  // Top-down
    bmi.bmiHeader.biPlanes = 1;
    bmi.bmiHeader.biBitCount = 32;
    bmi.bmiHeader.biCompression = BI_RGB;

    NativePixels pixels;
    pixels.width = quint32(width);
    pixels.height = quint32(height);
    pixels.bgra.resize(std::size_t(width) * std::size_t(height) * 4);
    // GDI leaves the fourth byte undefined.
    pixels.hasAlpha = false;
    if (GetDIBits(memoryDc.get(), bitmap.get(), 0, UINT(height), pixels.bgra.data(), &bmi,
                  DIB_RGB_COLORS) == 0) {
        return Result<NativePixels>::failure(lastError(NativeStep::ReadBits, "GetDIBits"));
    }
    return Result<NativePixels>::success(std::move(pixels));
}

} // namespace

Win32NativeApiBackend::Win32NativeApiBackend(std::shared_ptr<RasterBudget> budget)
    : m_budget(std::move(budget))
{
}

Win32NativeApiBackend::~Win32NativeApiBackend() = default;

QString Win32NativeApiBackend::backendName() const
{
    return QStringLiteral("Win32");
}

Result<Acknowledgement> Win32NativeApiBackend::initialize()
{
    // User32 needs no per-thread setup beyond running on a single thread.
    return Result<Acknowledgement>::success(Acknowledgement{});
}

Result<std::vector<WindowHandle>> Win32NativeApiBackend::enumerateWindows()
{
    std::vector<WindowHandle> handles;
    if (!EnumWindows(collectTitledWindows, reinterpret_cast<LPARAM>(&handles))) {
        Error error = lastError(NativeStep::EnumerateWindows, "EnumWindows");
        qWarning() << "Win32NativeApiBackend:" << error.toString();
        return Result<std::vector<WindowHandle>>::failure(error);
    }
    return Result<std::vector<WindowHandle>>::success(std::move(handles));
}

Result<QString> Win32NativeApiBackend::windowTitle(WindowHandle handle)
{
    WCHAR title[kTitleBufferLength];
    const int length = GetWindowTextW(toHwnd(handle), title, kTitleBufferLength);
    if (length <= 0) {
        return Result<QString>::success(QString());
    }
    return Result<QString>::success(QString::fromWCharArray(title, length));
}

Result<WindowRect> Win32NativeApiBackend::windowRect(WindowHandle handle)
{
    return queryWindowRect(toHwnd(handle)).map([](const RECT &rect) {
        return WindowRect{int(rect.left), int(rect.top), int(rect.right), int(rect.bottom)};
    });
}

Result<bool> Win32NativeApiBackend::isWindowFocused(WindowHandle handle)
{
    return Result<bool>::success(GetForegroundWindow() == toHwnd(handle));
}

Result<Raster> Win32NativeApiBackend::captureWindowImage(WindowHandle handle)
{
    Win32CaptureSteps steps(toHwnd(handle));
    return WindowCapture::run(steps, m_budget);
}

} // namespace DeskProbe
