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

/**
 * @file EmeScheduler.h
 * @brief Class to schedule commands for async execution
 */

#ifndef __EME_SCHEDULER_H__
#define __EME_SCHEDULER_H__

#include <functional>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>
#include "EmeDefine.h"
#include "EmeLogManager.h"

typedef std::function<void (void *)> AsyncTask;

/**
 * @struct AsyncTaskObj
 * @brief Async task operations
 */
struct AsyncTaskObj
{
	AsyncTask mTask;
	void * mData;
	std::string mTaskName;
	int mId;

	AsyncTaskObj(AsyncTask task, void *data, std::string tskName="", int id = EME_TASK_ID_INVALID) :
				mTask(task), mData(data), mTaskName(tskName), mId(id)
	{
	}

	AsyncTaskObj(const AsyncTaskObj &other) : mTask(other.mTask), mData(other.mData), mTaskName(other.mTaskName), mId(other.mId)
	{
	}

	AsyncTaskObj& operator=(const AsyncTaskObj& other)
	{
		mTask = other.mTask;
		mData = other.mData;
		mTaskName = other.mTaskName;
		mId = other.mId;
		return *this;
	}
};

/**
 * @class EmeScheduler
 * @brief Runs queued tasks one at a time, in FIFO order, on a dedicated worker thread
 */
class EmeScheduler
{
public:
	/**
	 * @brief EmeScheduler Constructor
	 */
	EmeScheduler();

	/**
	 * @brief Copy constructor disabled
	 *
	 */
	EmeScheduler(const EmeScheduler&) = delete;

	/**
	 * @brief assignment operator disabled
	 *
	 */
	EmeScheduler& operator=(const EmeScheduler&) = delete;

	/**
	 * @brief EmeScheduler Destructor
	 */
	virtual ~EmeScheduler();

	/**
	 * @brief To schedule a task to be executed later
	 *
	 * @param[in] obj - object to be scheduled
	 * @return int - scheduled task id, EME_TASK_ID_INVALID if the task was not queued
	 */
	int ScheduleTask(AsyncTaskObj obj);

	/**
	 * @brief To remove all scheduled tasks and prevent further tasks from scheduling
	 */
	void RemoveAllTasks();

	/**
	 * @brief To start scheduler thread
	 * @param[in] controllerId - id used to tag log lines from the worker
	 */
	void StartScheduler(int controllerId);

	/**
	 * @brief To stop scheduler and associated resources
	 * @note from a task on the worker itself the queue is dropped and the thread detached instead of joined
	 */
	void StopScheduler();

	/**
	 * @brief To acquire execution lock for synchronization purposes
	 */
	void SuspendScheduler();

	/**
	 * @brief To release execution lock
	 */
	void ResumeScheduler();

	/**
	 * @brief Check whether the calling thread is the scheduler worker
	 */
	bool IsSchedulerThread() const;

	/**
	 * @brief Check whether the worker thread is running
	 */
	bool IsRunning() const { return mSchedulerRunning; }

protected:
	/**
	 * @brief Executes scheduled tasks - invoked by thread
	 */
	void ExecuteAsyncTask();

	std::deque<AsyncTaskObj> mTaskQueue;	/**< Queue for storing async tasks */
	std::mutex mQMutex;			/**< Mutex for accessing mTaskQueue */
	std::condition_variable mQCond;		/**< To notify when a task is queued in mTaskQueue */
	bool mSchedulerRunning;			/**< Flag denotes if scheduler thread is running */
	std::thread mSchedulerThread;		/**< Scheduler thread */
	std::mutex mExMutex;			/**< Execution mutex for synchronization */
	std::unique_lock<std::mutex> mExLock;	/**< Lock to be used by SuspendScheduler and ResumeScheduler */
	int mNextTaskId;			/**< Counter that holds ID value of next task to be scheduled */
	bool mLockOut;				/**< flag indicates if the queue is locked out or not */
	int mControllerId;
};

/**
 * @brief Queue a closure that takes no task data
 * @param[in] scheduler - scheduler to queue on
 * @param[in] task - closure to run on the scheduler thread
 * @param[in] taskName - name used in scheduler logs
 * @note a refused task is logged and dropped
 */
void eme_ScheduleClosure(EmeScheduler &scheduler, std::function<void ()> task, const std::string &taskName);

#endif /* __EME_SCHEDULER_H__ */
