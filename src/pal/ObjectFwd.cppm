export module pal:ObjectFwd;

namespace pal {

export class Function;
export class NativeFunction;
export class Generator;
export class Iterator;
export class NativeIterator;
export class Enum;
export class NativeEnum;
export class NativeObject;

export class CallContext;

} // namespace pal
