#ifndef BASALT_BASALTUTIL_HPP
#define BASALT_BASALTUTIL_HPP

#ifdef BASALT_DEBUG

#define debug(stmt) stmt

#else

// do nothing
#define debug(stmt)

#endif

#endif //BASALT_BASALTUTIL_HPP
