#pragma once

/*compile-time defaults; override any of them with -D at configure time*/

#ifndef TV_IMAGE_BASE_URL
#define TV_IMAGE_BASE_URL "http://www.televideo.rai.it/televideo/pub/tt4web/Nazionale"
#endif

#ifndef TV_CACHE_TTL_SECONDS
#define TV_CACHE_TTL_SECONDS 300
#endif

#ifndef TV_FETCH_TIMEOUT_SECONDS
#define TV_FETCH_TIMEOUT_SECONDS 10
#endif

#ifndef TV_POLL_INTERVAL_MS
#define TV_POLL_INTERVAL_MS 100
#endif

// how long the device-attributes reply may take (slow links, ssh)
#ifndef TV_DA1_TIMEOUT_MS
#define TV_DA1_TIMEOUT_MS 300
#endif

#ifndef TV_HEADER_ROWS
#define TV_HEADER_ROWS 1
#endif

#ifndef TV_FOOTER_ROWS
#define TV_FOOTER_ROWS 1
#endif

#define TV_USER_AGENT "televideo-term/1.0"
