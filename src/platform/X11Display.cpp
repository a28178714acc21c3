#include "platform/X11Display.hpp"

#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

#include <cstdlib>

namespace gamevision {

namespace {

int g_lastErrorCode = 0;
unsigned char g_lastRequestCode = 0;

int trapHandler(Display* /*display*/, XErrorEvent* event) {
    if (g_lastErrorCode == 0) {
        g_lastErrorCode = event->error_code;
        g_lastRequestCode = event->request_code;
    }
    return 0;
}

int shiftOf(unsigned long mask) {
    if (mask == 0) {
        return 0;
    }
    return __builtin_ctzl(mask);
}

}  // namespace

DisplayPtr openDisplay() {
    const char* displayEnv = std::getenv("DISPLAY");
    if (!displayEnv || displayEnv[0] == '\0') {
        return nullptr;
    }
    return DisplayPtr(XOpenDisplay(nullptr));
}

X11ErrorTrap::X11ErrorTrap(Display* display) : display_(display) {
    XSync(display_, False);
    g_lastErrorCode = 0;
    g_lastRequestCode = 0;
    previous_ = XSetErrorHandler(trapHandler);
}

X11ErrorTrap::~X11ErrorTrap() {
    XSync(display_, False);
    XSetErrorHandler(previous_);
}

bool X11ErrorTrap::failed() {
    XSync(display_, False);
    return g_lastErrorCode != 0;
}

int X11ErrorTrap::errorCode() const {
    return g_lastErrorCode;
}

std::string X11ErrorTrap::describe() const {
    if (g_lastErrorCode == 0) {
        return "no error";
    }
    char text[256] = {0};
    XGetErrorText(display_, g_lastErrorCode, text, sizeof(text));
    return std::string(text) + " (request " +
           std::to_string(static_cast<int>(g_lastRequestCode)) + ")";
}

std::vector<MonitorInfo> listMonitorsX11(Display* display) {
    std::vector<MonitorInfo> result;
    if (!display) {
        return result;
    }
    Window root = DefaultRootWindow(display);
    int eventBase = 0;
    int errorBase = 0;
    if (!XRRQueryExtension(display, &eventBase, &errorBase)) {
        return result;
    }
    XRRScreenResources* resources = XRRGetScreenResourcesCurrent(display, root);
    if (!resources) {
        return result;
    }

    RROutput primary = XRRGetOutputPrimary(display, root);
    for (int i = 0; i < resources->noutput; ++i) {
        RROutput output = resources->outputs[i];
        XRROutputInfo* info = XRRGetOutputInfo(display, resources, output);
        if (!info) {
            continue;
        }
        if (info->connection == RR_Connected && info->crtc) {
            XRRCrtcInfo* crtc = XRRGetCrtcInfo(display, resources, info->crtc);
            if (crtc) {
                MonitorInfo mon;
                mon.name.assign(info->name, info->nameLen);
                mon.x = crtc->x;
                mon.y = crtc->y;
                mon.w = static_cast<int>(crtc->width);
                mon.h = static_cast<int>(crtc->height);
                mon.scale = 1.0f;
                mon.primary = (output == primary);
                result.push_back(mon);
                XRRFreeCrtcInfo(crtc);
            }
        }
        XRRFreeOutputInfo(info);
    }
    XRRFreeScreenResources(resources);
    return result;
}

std::string compositingSelectionName(int screen) {
    return "_NET_WM_CM_S" + std::to_string(screen);
}

bool compositingManagerRunning(Display* display, int screen) {
    Atom selection = XInternAtom(
        display, compositingSelectionName(screen).c_str(), False);
    return XGetSelectionOwner(display, selection) != None;
}

bool ximageToPixelBuffer(XImage* image, int w, int h, PixelBuffer& out) {
    if (!image || w <= 0 || h <= 0) {
        return false;
    }
    out.w = w;
    out.h = h;
    out.rgba.resize(out.expectedBytes());

    const unsigned long rmask = image->red_mask;
    const unsigned long gmask = image->green_mask;
    const unsigned long bmask = image->blue_mask;
    const int rshift = shiftOf(rmask);
    const int gshift = shiftOf(gmask);
    const int bshift = shiftOf(bmask);
    const unsigned long rmax = rmask >> rshift;
    const unsigned long gmax = gmask >> gshift;
    const unsigned long bmax = bmask >> bshift;

    for (int iy = 0; iy < h; ++iy) {
        for (int ix = 0; ix < w; ++ix) {
            unsigned long pixel = XGetPixel(image, ix, iy);
            unsigned long r = (pixel & rmask) >> rshift;
            unsigned long g = (pixel & gmask) >> gshift;
            unsigned long b = (pixel & bmask) >> bshift;
            size_t idx = (static_cast<size_t>(iy) * static_cast<size_t>(w) +
                          static_cast<size_t>(ix)) *
                         4u;
            out.rgba[idx + 0] =
                static_cast<std::uint8_t>(rmax ? (r * 255ul / rmax) : 0);
            out.rgba[idx + 1] =
                static_cast<std::uint8_t>(gmax ? (g * 255ul / gmax) : 0);
            out.rgba[idx + 2] =
                static_cast<std::uint8_t>(bmax ? (b * 255ul / bmax) : 0);
            out.rgba[idx + 3] = 255;
        }
    }
    return true;
}

}  // namespace gamevision
