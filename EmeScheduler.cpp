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
 * @file EmeScheduler.cpp
 * @brief Class to schedule commands for async execution
 */

#include "EmeScheduler.h"
#include "EmeUtils.h"

/**
 * @brief EmeScheduler Constructor
 */
EmeScheduler::EmeScheduler() : mTaskQueue(), mQMutex(), mQCond(),
	mSchedulerRunning(false), mSchedulerThread(), mExMutex(),
	mExLock(mExMutex, std::defer_lock), mNextTaskId(EME_SCHEDULER_ID_DEFAULT),
	mLockOut(false), mControllerId(-1)
{
}

/**
 * @brief EmeScheduler Destructor
 */
EmeScheduler::~EmeScheduler()
{
	if (mSchedulerRunning)
	{
		StopScheduler();
	}
}

/**
 * @brief To start scheduler thread
 */
void EmeScheduler::StartScheduler( int controllerId )
{
	mControllerId = controllerId;
	std::lock_guard<std::mutex>lock(mQMutex);
	mSchedulerRunning = true;
	mSchedulerThread = std::thread(std::bind(&EmeScheduler::ExecuteAsyncTask, this));
	EMELOG_INFO("Thread created Async Worker [%zx]", GetPrintableThreadID(mSchedulerThread));
}

/**
 * @brief To schedule a task to be executed later
 */
int EmeScheduler::ScheduleTask(AsyncTaskObj obj)
{
	int id = EME_TASK_ID_INVALID;
	std::lock_guard<std::mutex>lock(mQMutex);
	if (mSchedulerRunning)
	{
		if (!mLockOut)
		{
			id = mNextTaskId++;
			// Upper limit check
			if (mNextTaskId >= EME_SCHEDULER_ID_MAX_VALUE)
			{
				mNextTaskId = EME_SCHEDULER_ID_DEFAULT;
			}
			obj.mId = id;
			mTaskQueue.push_back(obj);
			mQCond.notify_one();
		}
		else
		{
			// may happen during teardown, hence info log
			EMELOG_INFO("Warning: Attempting to schedule a task when scheduler is locked out, skipping operation %s!!", obj.mTaskName.c_str());
		}
	}
	else
	{
		EMELOG_ERR("Attempting to schedule a task when scheduler is not running, task ignored:%s", obj.mTaskName.c_str());
	}
	return id;
}

/**
 * @brief Executes scheduled tasks - invoked by thread
 */
void EmeScheduler::ExecuteAsyncTask()
{
	UsingControllerId controllerId( mControllerId );
	std::unique_lock<std::mutex>queueLock(mQMutex);
	while (mSchedulerRunning)
	{
		if (mTaskQueue.empty())
		{
			mQCond.wait(queueLock);
		}
		else
		{
			/*
			Take the execution lock before taking a task from the queue
			otherwise this function could hold a task, out of the queue,
			that cannot be deleted by RemoveAllTasks()!
			Allow the queue to be modified while waiting.*/
			queueLock.unlock();
			std::lock_guard<std::mutex>executionLock(mExMutex);
			queueLock.lock();

			//mTaskQueue could have been modified while waiting for execute permission
			if (!mTaskQueue.empty())
			{
				AsyncTaskObj obj = mTaskQueue.front();
				mTaskQueue.pop_front();
				if (obj.mId != EME_TASK_ID_INVALID)
				{
					//Unlock so that new entries can be added to queue while function executes
					queueLock.unlock();

					EMELOG_DEBUG("SchedulerTask Execution:%s taskId:%d", obj.mTaskName.c_str(), obj.mId);
					obj.mTask(obj.mData);
					//May be used in a wait() in future loops, it needs to be locked
					queueLock.lock();
				}
				else
				{
					EMELOG_ERR("Scheduler found a task with invalid ID, skip task!");
				}
			}
		}
	}
	EMELOG_INFO("Exited Async Worker Thread");
}

/**
 * @brief To remove all scheduled tasks and prevent further tasks from scheduling
 */
void EmeScheduler::RemoveAllTasks()
{
	std::lock_guard<std::mutex>lock(mQMutex);
	if(!mLockOut)
	{
		EMELOG_WARN("The scheduler is active.  An active task may continue to execute after this function exits.  Call SuspendScheduler() prior to this function to prevent this.");
	}
	if (!mTaskQueue.empty())
	{
		EMELOG_WARN("Clearing up %d entries from mTaskQueue", (int)mTaskQueue.size());
		mTaskQueue.clear();
	}
}

/**
 * @brief To stop scheduler and associated resources
 */
void EmeScheduler::StopScheduler()
{
	EMELOG_INFO("Stopping Async Worker Thread");
	{
		std::lock_guard<std::mutex>lock(mQMutex);
		mSchedulerRunning = false;
	}

	// the worker holds mExMutex while a task runs, suspending or joining from it would deadlock
	if (IsSchedulerThread())
	{
		EMELOG_ERR("StopScheduler called from the Async Worker, detaching");
		{
			std::lock_guard<std::mutex>lock(mQMutex);
			mTaskQueue.clear();
		}
		mSchedulerThread.detach();
		return;
	}

	//allow StopScheduler() to be called from a nonsuspended state without
	//ResumeScheduler() below trying to unlock an unlocked lock
	if(!mLockOut)
	{
		SuspendScheduler();
	}

	RemoveAllTasks();

	//prevent possible deadlock where mSchedulerThread is waiting for mExLock/mExMutex
	ResumeScheduler();
	mQCond.notify_one();
	if (mSchedulerThread.joinable())
	{
		mSchedulerThread.join();
	}
}

/**
 * @brief To acquire execution lock for synchronization purposes
 */
void EmeScheduler::SuspendScheduler()
{
	mExLock.lock();
	std::lock_guard<std::mutex>lock(mQMutex);
	mLockOut = true;
}

/**
 * @brief To release execution lock
 */
void EmeScheduler::ResumeScheduler()
{
	mExLock.unlock();
	std::lock_guard<std::mutex>lock(mQMutex);
	mLockOut = false;
}

bool EmeScheduler::IsSchedulerThread() const
{
	return mSchedulerThread.get_id() == std::this_thread::get_id();
}

void eme_ScheduleClosure(EmeScheduler &scheduler, std::function<void ()> task, const std::string &taskName)
{
	int id = scheduler.ScheduleTask(AsyncTaskObj([task](void *) { task(); }, nullptr, taskName));
	if (id == EME_TASK_ID_INVALID)
	{
		EMELOG_WARN("Task %s dropped", taskName.c_str());
	}
}
