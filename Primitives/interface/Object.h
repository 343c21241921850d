/*
 *  Copyright 2024 Diligent Graphics LLC
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 *  In no event and under no legal theory, whether in tort (including negligence),
 *  contract, or otherwise, unless required by applicable law (such as deliberate
 *  and grossly negligent acts) or agreed to in writing, shall any Contributor be
 *  liable for any damages, including any direct, indirect, special, incidental,
 *  or consequential damages of any character arising as a result of this License or
 *  out of the use or inability to use the software (including but not limited to damages
 *  for loss of goodwill, work stoppage, computer failure or malfunction, or any and
 *  all other commercial damages or losses), even if such Contributor has been advised
 *  of the possibility of such damages.
 */


#pragma once

#include "InterfaceID.h"

namespace Bindery
{

using ReferenceCounterValueType = long;

/// Base interface for all dynamic objects in the engine
class IObject
{
public:
    /// Queries the specific interface.

    /// \param [in]  IID         - Unique identifier of the requested interface.
    /// \param [out] ppInterface - Memory address where the pointer to the requested interface will be written.
    ///                            If the interface is not supported, null pointer will be returned.
    /// \remark The method calls AddRef() on the interface that is returned.
    virtual void QueryInterface(const INTERFACE_ID& IID, IObject** ppInterface) = 0;

    /// Increments the number of strong references by 1.

    /// \return The number of strong references after incrementing the counter.
    virtual ReferenceCounterValueType AddRef() = 0;

    /// Decrements the number of strong references by 1 and destroys the object when the
    /// counter reaches zero.

    /// \return The number of strong references after decrementing the counter.
    virtual ReferenceCounterValueType Release() = 0;

protected:
    ~IObject() = default;
};

} // namespace Bindery
