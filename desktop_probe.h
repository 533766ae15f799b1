/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef DESKTOP_PROBE_H
#define DESKTOP_PROBE_H

#include <optional>

// Forward declaration so that Xlib's macros stay out of every file that includes this header.
typedef struct _XDisplay Display;

namespace WallpaperRotate {

//!
//! \brief The DesktopProbe class reports which workspace is in front.
//!
class DesktopProbe
{
public:
    virtual ~DesktopProbe() = default;

    //!
    //! \brief Provides the current workspace number, 1 based to match the wsN config sections.
    //! \return std::nullopt if the workspace cannot be determined right now.
    //!
    virtual std::optional<int> CurrentWorkspaceNumber() = 0;
};

//!
//! \brief DesktopProbe for X11 window managers that publish the EWMH _NET_CURRENT_DESKTOP root window property. The
//! display connection is opened lazily, held open, and dropped after an error so that the next call reconnects.
//!
class X11DesktopProbe : public DesktopProbe
{
public:
    X11DesktopProbe();
    ~X11DesktopProbe() override;

    X11DesktopProbe(const X11DesktopProbe&) = delete;
    X11DesktopProbe& operator=(const X11DesktopProbe&) = delete;

    std::optional<int> CurrentWorkspaceNumber() override;

    //!
    //! \brief Xlib IO error exit handler. Marks the probe passed as user_data as disconnected and returns, so Xlib does
    //! not exit the process when the X server goes away.
    //!
    static void HandleIOErrorExit(Display* display, void* user_data);

    //!
    //! \brief True from an IO error until the next query drops the dead connection.
    //!
    bool IsConnectionLost() const;

private:
    bool Connect();
    void Disconnect();

    Display* m_display;
    unsigned long m_current_desktop_atom;
    bool m_connection_lost;
};

} // namespace WallpaperRotate

#endif // DESKTOP_PROBE_H
