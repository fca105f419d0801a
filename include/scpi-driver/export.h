#ifndef SCPI_DRIVER_EXPORT_H
#define SCPI_DRIVER_EXPORT_H

#ifdef _WIN32
#ifdef scpi_driver_core_EXPORTS
#define SCPI_DRIVER_API __declspec(dllexport)
#else
#define SCPI_DRIVER_API __declspec(dllimport)
#endif
#else
#define SCPI_DRIVER_API
#endif

#endif // SCPI_DRIVER_EXPORT_H
