/*
 *  Copyright (c) 2016, Airbitz
 *  All rights reserved.
 *
 *  Redistribution and use in source and binary forms are permitted provided that
 *  the following conditions are met:
 *
 *  1. Redistributions of source code must retain the above copyright notice, this
 *  list of conditions and the following disclaimer.
 *  2. Redistributions in binary form must reproduce the above copyright notice,
 *  this list of conditions and the following disclaimer in the documentation
 *  and/or other materials provided with the distribution.
 *  3. Redistribution or use of modified source code requires the express written
 *  permission of Airbitz Inc.
 *
 *  THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 *  ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 *  WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 *  DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
 *  ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 *  (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 *  LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 *  ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 *  (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 *  SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 *  The views and conclusions contained in the software and documentation are those
 *  of the authors and should not be interpreted as representing official policies,
 *  either expressed or implied, of the Airbitz Project.
 */
/**
 * @file
 * Public definitions shared by the payment core and its callers.
 */

#ifndef XPC_h
#define XPC_h

#include <stdint.h>

/** The default gRPC endpoint for the current ledger protocol */
#define XPC_DEFAULT_GRPC_ENDPOINT "127.0.0.1:50051"

/** The default gRPC-Web endpoint for the legacy protocol */
#define XPC_DEFAULT_LEGACY_ENDPOINT "https://envoy.test.xrp.xpring.io"

/** The number of drops in one XRP */
#define XPC_DROPS_PER_XRP 1000000

#define XPC_VERSION "0.2.0"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Payment Core Condition Codes
 *
 * Every fallible core function reports one of these codes.
 * XPC_CC_Ok indicates that there was no issue.
 * All other values indicate some issue.
 *
 */
typedef enum eXPC_CC
{
    /** The function completed without an error */
    XPC_CC_Ok = 0,
    /** An error occured */
    XPC_CC_Error = 1,
    /** The caller supplied a malformed ledger address */
    XPC_CC_InvalidAddress = 2,
    /** A backend call failed or returned no payload */
    XPC_CC_NetworkError = 3,
    /** A backend reply is missing a required field */
    XPC_CC_MalformedResponse = 4,
    /** The signer failed or produced nothing */
    XPC_CC_SigningFailure = 5,
    /** JSON parsing error */
    XPC_CC_JSONError = 6,
    /** Input could not be parsed */
    XPC_CC_ParseError = 7,
    /** System (operating system) error */
    XPC_CC_SysError = 8,
    /** The caller's deadline passed before the operation finished */
    XPC_CC_Timeout = 9,
} tXPC_CC;

#ifdef __cplusplus
}
#endif

#endif
