/**
 * @file
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Aapo Kyrola, Guy Blelloch, Carlos Guestrin / Carnegie Mellon University]
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


 *
 * @section DESCRIPTION
 *
 * Pthread wrappers.
 */

#ifndef VODREC_PTHREAD_TOOLS_HPP
#define VODREC_PTHREAD_TOOLS_HPP

#include <cstdio>
#include <pthread.h>

namespace vodrec {

    /**
     * \class mutex
     *
     * Wrapper around pthread's mutex.
     */
    class mutex {
    private:
        mutable pthread_mutex_t m_mut;
        mutex(const mutex &);
        mutex & operator=(const mutex &);
    public:
        mutex() {
            pthread_mutex_init(&m_mut, NULL);
        }
        inline void lock() const {
            pthread_mutex_lock(&m_mut);
        }
        inline void unlock() const {
            pthread_mutex_unlock(&m_mut);
        }
        ~mutex() {
            int error = pthread_mutex_destroy(&m_mut);
            if (error)
                perror("Error: failed to destroy mutex");
        }
    }; // End of Mutex

    /** Locks a mutex for the lifetime of the scope. */
    class scoped_lock {
        const mutex & m;
        scoped_lock(const scoped_lock &);
        scoped_lock & operator=(const scoped_lock &);
    public:
        explicit scoped_lock(const mutex & _m) : m(_m) { m.lock(); }
        ~scoped_lock() { m.unlock(); }
    };

}

#endif
