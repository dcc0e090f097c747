/*
 * If not stated otherwise in this file or this component's license file the
 * following copyright and licenses apply:
 *
 * Copyright 2020 RDK Management
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef EMELOGMANAGER_H
#define EMELOGMANAGER_H

/**
 * @file EmeLogManager.h
 * @brief Log manager for the EME key-system controller
 */

#include <vector>
#include <string>
#include <cstdint>
#include <iomanip> // std::setfill
#include <sstream> // std::ostringstream
#include <algorithm> // std::for_each

/**
 * @brief Log levels
 */
enum EME_LogLevel
{
	eLOGLEVEL_TRACE,    /**< Trace level */
	eLOGLEVEL_DEBUG,	/**< Debug level */
	eLOGLEVEL_INFO,     /**< Info level */
	eLOGLEVEL_WARN,     /**< Warn level */
	eLOGLEVEL_MIL,      /**< Milestone level */
	eLOGLEVEL_ERROR,    /**< Error level */
};

/**
 * @fn logprintf
 * @param[in] level - log level of the message
 * @param[in] file - function name of the caller
 * @param[in] line - line number of the caller
 * @param[in] format - printf style string
 * @return void
 */
extern void logprintf(EME_LogLevel level, const char* file, int line, const char *format, ...)  __attribute__ ((format (printf, 4, 5)));

/**
 * @class EmeLogManager
 * @brief EmeLogManager Class
 */
class EmeLogManager
{
public:
	static bool disableLogRedirection;		/**<  disables log re-direction to journal and uses vprintf - used by test harnesses */
	static EME_LogLevel emeLoglevel;
	static bool locked;

	/**
	 * @fn isLogLevelAllowed
	 *
	 * @param[in] chkLevel - log level
	 * @retval true if the log level allowed for print mechanism
	 */
	static bool isLogLevelAllowed(EME_LogLevel chkLevel)
	{
		return (chkLevel>=emeLoglevel);
	}

	/**
	 * @fn setLogLevel
	 *
	 * @param[in] newLevel - log level new value
	 * @return void
	 */
	static void setLogLevel(EME_LogLevel newLevel)
	{
		if( !locked )
		{
			emeLoglevel = newLevel;
		}
	}

	/**
	 * @brief lock or unlock log level. While locked, subsequent calls to setLogLevel are ignored,
	 * so a level forced from configuration survives later per-session adjustments.
	 *
	 * @param lock if true, subsequent calls to setLogLevel will be ignored
	 */
	static void lockLogLevel( bool lock )
	{
		locked = lock;
	}

	/**
	 * @fn getHexDebugStr
	 */
	static std::string getHexDebugStr(const std::vector<uint8_t>& data)
	{
		std::ostringstream hexSs;
		hexSs << "0x";
		hexSs << std::hex << std::uppercase << std::setfill('0');
		std::for_each(data.cbegin(), data.cend(), [&](int c) { hexSs << std::setw(2) << c; });
		return hexSs.str();
	}
};

extern thread_local int gControllerId;

/**
 * @class UsingControllerId
 * @brief Tags log lines emitted on the current thread with a controller id for the lifetime of the object
 */
class UsingControllerId
{
private:
	int oldControllerId;
public:
	UsingControllerId( int controllerId ): oldControllerId(gControllerId)
	{
		gControllerId = controllerId;
	}
	~UsingControllerId()
	{
		gControllerId = oldControllerId;
	}
};

/**
 * @fn DumpBlob
 *
 * @param[in] ptr to the buffer
 * @param[in] len length of buffer
 *
 * @return void
 */
void DumpBlob(const unsigned char *ptr, size_t len);

#define EME_TIMESTAMP_PREFIX_MAX_CHARS 20
#define EME_TIMESTAMP_PREFIX_FORMAT "%u.%03u: "

/**
 * @brief convenience macro for logging framework
 *
 * @param level gives priority for the logging, which drives filtering of whether it should be presented.
 *
 * @param FORMAT is standard printf style format string followed by arguments
 */
#define EMELOG( LEVEL, FORMAT, ... ) \
do { \
if( (LEVEL) >= EmeLogManager::emeLoglevel ) \
{ \
logprintf( LEVEL, __FUNCTION__, __LINE__, FORMAT, ##__VA_ARGS__); \
} \
} while(0)

/**
 * @brief logging defines, verbosity is adjusted through setLogLevel() as per the need
 */
#define EMELOG_TRACE(FORMAT, ...) EMELOG(eLOGLEVEL_TRACE, FORMAT, ##__VA_ARGS__)
#define EMELOG_DEBUG(FORMAT, ...) EMELOG(eLOGLEVEL_DEBUG, FORMAT, ##__VA_ARGS__)
#define EMELOG_INFO(FORMAT, ...)  EMELOG(eLOGLEVEL_INFO, FORMAT, ##__VA_ARGS__)
#define EMELOG_WARN(FORMAT, ...)  EMELOG(eLOGLEVEL_WARN, FORMAT, ##__VA_ARGS__)
#define EMELOG_MIL(FORMAT, ...)   EMELOG(eLOGLEVEL_MIL, FORMAT, ##__VA_ARGS__)
#define EMELOG_ERR(FORMAT, ...)   EMELOG(eLOGLEVEL_ERROR, FORMAT, ##__VA_ARGS__)

#endif /* EMELOGMANAGER_H */
