#ifndef LAB_INSTRUMENTS_EXPORT_H
#define LAB_INSTRUMENTS_EXPORT_H

#ifdef _WIN32
#ifdef lab_instruments_core_EXPORTS
#define LAB_INSTRUMENTS_API __declspec(dllexport)
#else
#define LAB_INSTRUMENTS_API __declspec(dllimport)
#endif
#else
#define LAB_INSTRUMENTS_API
#endif

#endif // LAB_INSTRUMENTS_EXPORT_H
