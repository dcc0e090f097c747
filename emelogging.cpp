/*
 * If not stated otherwise in this file or this component's license file the
 * following copyright and licenses apply:
 *
 * Copyright 2018 RDK Management
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

/**
 * @file emelogging.cpp
 * @brief EME key-system logging mechanism source file
 */

#include <cstdarg>
#include <cstdio>
#include <sys/time.h>
#include <alloca.h>
#include "EmeLogManager.h"
#include "EmeUtils.h"

#ifdef USE_SYSTEMD_JOURNAL_PRINT
#include <systemd/sd-journal.h>
#endif

static const char *mLogLevelStr[eLOGLEVEL_ERROR+1] =
{
	"TRACE", // eLOGLEVEL_TRACE
	"DEBUG", // eLOGLEVEL_DEBUG
	"INFO",  // eLOGLEVEL_INFO
	"WARN",  // eLOGLEVEL_WARN
	"MIL",   // eLOGLEVEL_MIL
	"ERROR", // eLOGLEVEL_ERROR
};

#ifdef USE_SYSTEMD_JOURNAL_PRINT
bool EmeLogManager::disableLogRedirection = false;
#else
bool EmeLogManager::disableLogRedirection = true;
#endif
EME_LogLevel EmeLogManager::emeLoglevel = eLOGLEVEL_WARN;
bool EmeLogManager::locked = false;

thread_local int gControllerId = -1;

/**
 * @brief Print logs to console / journal
 */
void logprintf(EME_LogLevel logLevelIndex, const char* file, int line, const char *format, ...)
{
	char timestamp[EME_TIMESTAMP_PREFIX_MAX_CHARS];
	timestamp[0] = 0x00;
	if( EmeLogManager::disableLogRedirection )
	{ // add timestamp if not using sd_journal_print
		struct timeval t;
		gettimeofday(&t, NULL);
		snprintf(timestamp, sizeof(timestamp), EME_TIMESTAMP_PREFIX_FORMAT, (unsigned int)t.tv_sec, (unsigned int)t.tv_usec / 1000 );
	}

	char *format_ptr = NULL;
	int format_bytes = 0;
	for( int pass=0; pass<2; pass++ )
	{ // two pass: measure required bytes then populate format string
		format_bytes = snprintf(format_ptr, format_bytes,
							   "%s[EME-KEYSYS][%d][%s][%zx][%s][%d]%s\n",
							   timestamp,
							   gControllerId,
							   mLogLevelStr[logLevelIndex],
							   GetPrintableThreadID(),
							   file, line,
							   format );
		if( format_bytes<=0 )
		{
			break;
		}
		if( pass==0 )
		{
			format_bytes++; // include nul terminator
			format_ptr = (char *)alloca(format_bytes);
		}
		else
		{
			va_list args;
			va_start(args, format);
#ifdef USE_SYSTEMD_JOURNAL_PRINT
			if( !EmeLogManager::disableLogRedirection )
			{
				format_ptr[format_bytes-1] = 0x00; // strip newline, journal adds its own
				sd_journal_printv(LOG_NOTICE,format_ptr,args); // note: truncates to 2040 characters
			}
			else
#endif
			{
				vprintf( format_ptr, args );
			}
			va_end(args);
		}
	}
}

/**
 * @brief Compactly log blobs of binary data
 *
 */
void DumpBlob(const unsigned char *ptr, size_t len)
{
#define FIT_CHARS 64
	char buf[FIT_CHARS + 1]; // pad for NUL
	char *dst = buf;
	const unsigned char *fin = ptr+len;
	int fit = FIT_CHARS;
	while (ptr < fin)
	{
		unsigned char c = *ptr++;
		if (c >= ' ' && c < 128)
		{ // printable ascii
			*dst++ = c;
			fit--;
		}
		else if( fit>=4 )
		{
			*dst++ = '[';
			WRITE_HASCII( dst, c );
			*dst++ = ']';
			fit -= 4;
		}
		else
		{
			fit = 0;
		}
		if (fit==0 || ptr==fin )
		{
			*dst++ = 0x00;

			EMELOG_WARN("%s", buf);
			dst = buf;
			fit = FIT_CHARS;
		}
	}
}
