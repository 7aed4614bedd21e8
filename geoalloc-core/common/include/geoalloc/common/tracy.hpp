#pragma once

#ifdef GEOALLOC_ENABLE_TRACY
#  include <tracy/Tracy.hpp>
#  define GEOALLOC_ZONE ZoneScoped
#  define GEOALLOC_ZONE_N(name) ZoneScopedN(name)
#else
#  define GEOALLOC_ZONE
#  define GEOALLOC_ZONE_N(name)
#endif
