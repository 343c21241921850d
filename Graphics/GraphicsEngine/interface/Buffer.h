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

/// \file
/// Defines Bindery::IBuffer interface and related data structures

#include "DeviceObject.h"

namespace Bindery
{

// {EC47EAD3-A2C4-44F2-81C5-5248D14F10E4}
static constexpr INTERFACE_ID IID_Buffer =
    {0xec47ead3, 0xa2c4, 0x44f2, {0x81, 0xc5, 0x52, 0x48, 0xd1, 0x4f, 0x10, 0xe4}};

/// Describes the buffer access mode.

/// This enumeration is used by BufferDesc structure.
enum BUFFER_MODE : Uint8
{
    /// Undefined mode.
    BUFFER_MODE_UNDEFINED = 0,

    /// Structured buffer. Elements are ElementByteStride bytes wide.
    BUFFER_MODE_STRUCTURED,

    /// Raw buffer. The buffer is accessed as an array of 32-bit words.
    BUFFER_MODE_RAW,

    /// Helper value storing the total number of modes in the enumeration.
    BUFFER_MODE_NUM_MODES
};

/// Describes the intended use of a compute buffer
enum COMPUTE_BUFFER_TYPE : Uint8
{
    /// Regular structured buffer
    COMPUTE_BUFFER_TYPE_DEFAULT = 0,

    /// Byte-address buffer
    COMPUTE_BUFFER_TYPE_RAW,

    /// Append/consume structured buffer
    COMPUTE_BUFFER_TYPE_APPEND,

    /// Structured buffer with a hidden counter
    COMPUTE_BUFFER_TYPE_COUNTER,

    /// Constant buffer. A single element is ElementByteStride bytes.
    COMPUTE_BUFFER_TYPE_CONSTANT,

    /// Explicitly structured buffer
    COMPUTE_BUFFER_TYPE_STRUCTURED,

    /// Buffer holding arguments of indirect dispatches
    COMPUTE_BUFFER_TYPE_INDIRECT_ARGUMENTS,

    COMPUTE_BUFFER_TYPE_NUM_TYPES
};

/// Buffer description
struct BufferDesc : DeviceObjectAttribs
{
    /// Size of the buffer, in bytes
    Uint64 Size = 0;

    /// Buffer bind flags, see Bindery::BIND_FLAGS for details
    BIND_FLAGS BindFlags = BIND_NONE;

    /// Buffer mode, see Bindery::BUFFER_MODE
    BUFFER_MODE Mode = BUFFER_MODE_UNDEFINED;

    /// Intended compute use of the buffer, see Bindery::COMPUTE_BUFFER_TYPE
    COMPUTE_BUFFER_TYPE ComputeType = COMPUTE_BUFFER_TYPE_DEFAULT;

    /// Size of one element, in bytes. Must be non-zero; Size must be a multiple of it.
    Uint32 ElementByteStride = 0;

    BufferDesc() noexcept {}

    // clang-format off
    BufferDesc(const Char*         _Name,
               Uint64              _Size,
               BIND_FLAGS          _BindFlags,
               BUFFER_MODE         _Mode,
               COMPUTE_BUFFER_TYPE _ComputeType,
               Uint32              _ElementByteStride) noexcept :
        DeviceObjectAttribs{_Name             },
        Size               {_Size             },
        BindFlags          {_BindFlags        },
        Mode               {_Mode             },
        ComputeType        {_ComputeType      },
        ElementByteStride  {_ElementByteStride}
    {
    }
    // clang-format on

    /// Tests if two buffer descriptions are equal.

    /// \note Name is ignored by the comparison.
    bool operator==(const BufferDesc& RHS) const noexcept
    {
        // clang-format off
        return Size              == RHS.Size              &&
               BindFlags         == RHS.BindFlags         &&
               Mode              == RHS.Mode              &&
               ComputeType       == RHS.ComputeType       &&
               ElementByteStride == RHS.ElementByteStride;
        // clang-format on
    }

    bool operator!=(const BufferDesc& RHS) const noexcept
    {
        return !(*this == RHS);
    }
};

/// Describes the buffer initial data
struct BufferData
{
    /// Pointer to the data
    const void* pData = nullptr;

    /// Data size, in bytes
    Uint64 DataSize = 0;

    BufferData() noexcept {}

    BufferData(const void* _pData, Uint64 _DataSize) noexcept :
        pData{_pData},
        DataSize{_DataSize}
    {}
};

/// Buffer interface

/// Defines the methods to manipulate a buffer object
class IBuffer : public IDeviceObject
{
public:
    /// Returns the buffer description used to create the object
    virtual const BufferDesc& GetDesc() const override = 0;

    /// Returns true if the buffer memory is resident and can be bound.

    /// \remarks A buffer becomes invalid when its device storage has been lost or
    ///          reclaimed. An invalid buffer must be recreated.
    virtual bool IsValid() const = 0;
};

} // namespace Bindery
