#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_OBJECTMODEL_STATIC)
    #define NGIN_OBJECTMODEL_API
  #else
    #if defined(NGIN_OBJECTMODEL_EXPORTS)
      #define NGIN_OBJECTMODEL_API __declspec(dllexport)
    #else
      #define NGIN_OBJECTMODEL_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_OBJECTMODEL_API
#endif
