#pragma once

#if defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define NOMAT_PROFILE_FRAME_MARK() FrameMark
    #define NOMAT_PROFILE_FUNCTION() ZoneScoped
    #define NOMAT_PROFILE_SCOPE(name) ZoneScopedN(name)

#else
    // Empty macros when disabled
    #define NOMAT_PROFILE_FRAME_MARK()
    #define NOMAT_PROFILE_FUNCTION()
    #define NOMAT_PROFILE_SCOPE(name)

#endif
