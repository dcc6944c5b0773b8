#ifndef _VERIFS_API_DEFS_H
#define _VERIFS_API_DEFS_H

#if (defined _WINDOWS)
#  ifdef VERIFS_API_EXPORTS
#    define VERIFS_API_DECL __declspec (dllexport)
#  else
#    define VERIFS_API_DECL __declspec (dllimport)
#  endif
#else
#  define VERIFS_API_DECL __attribute__((visibility("default")))
#endif

#endif
