#ifndef QSESSION_DETAIL_EXPORTS_HPP
#define QSESSION_DETAIL_EXPORTS_HPP

#if defined(_WIN32) || defined(__CYGWIN__)
#   define QSESSION_HELPER_EXPORT __declspec(dllexport)
#   define QSESSION_HELPER_IMPORT __declspec(dllimport)
#   define QSESSION_HELPER_LOCAL
#else
#   if __GNUC__ >= 4
#       define QSESSION_HELPER_EXPORT __attribute__ ((visibility ("default")))
#       define QSESSION_HELPER_IMPORT __attribute__ ((visibility ("default")))
#       define QSESSION_HELPER_LOCAL __attribute__ ((visibility ("hidden")))
#   else
#       define QSESSION_HELPER_EXPORT
#       define QSESSION_HELPER_IMPORT
#       define QSESSION_HELPER_LOCAL
#   endif
#endif

#if defined(qsession_EXPORTS)
#   define QSESSION_API QSESSION_HELPER_EXPORT
#elif !defined(qsession_STATIC)
#   define QSESSION_API QSESSION_HELPER_IMPORT
#else
#   define QSESSION_API
#endif

#ifdef _MSC_VER
#   pragma warning(disable : 4275 4251)
#endif

#endif // QSESSION_DETAIL_EXPORTS_HPP
